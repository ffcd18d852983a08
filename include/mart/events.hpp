#ifndef MART_EVENTS_HPP
#define MART_EVENTS_HPP

#include <functional>
#include <mutex>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace mart {

// =============================================================================
// Event Records
// =============================================================================

// Emitted on every listing create/update/removal. A removal carries the
// zero address as seller and zero for every other field.
struct ListingUpdated {
    AssetId asset_id;
    Address seller;
    Amount sale_price;
    Timestamp expires_at;
    Currency currency;
    Amount historical_price;

    static ListingUpdated cleared(AssetId asset_id) {
        return ListingUpdated{asset_id, addresses::ZERO, 0, 0, NATIVE, 0};
    }

    bool is_cleared() const {
        return addresses::is_zero(seller) && sale_price == 0 && expires_at == 0;
    }

    bool operator==(const ListingUpdated& other) const {
        return asset_id == other.asset_id && seller == other.seller &&
               sale_price == other.sale_price && expires_at == other.expires_at &&
               currency == other.currency && historical_price == other.historical_price;
    }
};

// Emitted once per completed purchase
struct Purchased {
    AssetId asset_id;
    Address seller;
    Address buyer;
    Amount sale_price;
    Currency currency;
    Amount royalty_amount;

    bool operator==(const Purchased& other) const {
        return asset_id == other.asset_id && seller == other.seller &&
               buyer == other.buyer && sale_price == other.sale_price &&
               currency == other.currency && royalty_amount == other.royalty_amount;
    }
};

using Event = std::variant<ListingUpdated, Purchased>;

void to_json(nlohmann::json& j, const ListingUpdated& e);
void to_json(nlohmann::json& j, const Purchased& e);
void to_json(nlohmann::json& j, const Event& e);

// =============================================================================
// EventLog - Append-only Observable Log
// =============================================================================

class EventLog {
public:
    using Subscriber = std::function<void(const Event&)>;

    EventLog() = default;

    // Non-copyable
    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void emit(const Event& event);

    // Subscribers run synchronously, in registration order, after the
    // event is appended
    void subscribe(Subscriber subscriber);

    std::vector<Event> events() const;
    size_t size() const;
    void clear();

    // Typed views
    std::vector<ListingUpdated> listing_updates() const;
    std::vector<Purchased> purchases() const;

    nlohmann::json to_json() const;

private:
    std::vector<Event> events_;
    std::vector<Subscriber> subscribers_;
    mutable std::mutex mutex_;
};

} // namespace mart

#endif // MART_EVENTS_HPP
