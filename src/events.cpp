// =============================================================================
// events.cpp - Event Log & JSON Encoding
// =============================================================================

#include "mart/events.hpp"
#include <nlohmann/json.hpp>

namespace mart {

using json = nlohmann::json;

// =============================================================================
// JSON Encoding
// =============================================================================

// Amounts are encoded as decimal strings (128-bit values do not fit a JSON number)
void to_json(json& j, const ListingUpdated& e) {
    j = json{
        {"event", "UpdateListing"},
        {"asset_id", e.asset_id},
        {"seller", addresses::to_hex(e.seller)},
        {"sale_price", amounts::to_string(e.sale_price)},
        {"expires_at", e.expires_at},
        {"currency", addresses::to_hex(e.currency.addr)},
        {"historical_price", amounts::to_string(e.historical_price)}
    };
}

void to_json(json& j, const Purchased& e) {
    j = json{
        {"event", "Purchased"},
        {"asset_id", e.asset_id},
        {"seller", addresses::to_hex(e.seller)},
        {"buyer", addresses::to_hex(e.buyer)},
        {"sale_price", amounts::to_string(e.sale_price)},
        {"currency", addresses::to_hex(e.currency.addr)},
        {"royalty_amount", amounts::to_string(e.royalty_amount)}
    };
}

void to_json(json& j, const Event& e) {
    std::visit([&j](const auto& record) { to_json(j, record); }, e);
}

// =============================================================================
// EventLog
// =============================================================================

void EventLog::emit(const Event& event) {
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        subscribers = subscribers_;
    }

    // Outside the lock: a subscriber may read the log
    for (const auto& subscriber : subscribers) {
        subscriber(event);
    }
}

void EventLog::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(subscriber));
}

std::vector<Event> EventLog::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void EventLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

std::vector<ListingUpdated> EventLog::listing_updates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ListingUpdated> out;
    for (const auto& event : events_) {
        if (auto* e = std::get_if<ListingUpdated>(&event)) out.push_back(*e);
    }
    return out;
}

std::vector<Purchased> EventLog::purchases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Purchased> out;
    for (const auto& event : events_) {
        if (auto* e = std::get_if<Purchased>(&event)) out.push_back(*e);
    }
    return out;
}

json EventLog::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json out = json::array();
    for (const auto& event : events_) {
        json j;
        mart::to_json(j, event);
        out.push_back(std::move(j));
    }
    return out;
}

} // namespace mart
