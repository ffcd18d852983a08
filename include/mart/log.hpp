#ifndef MART_LOG_HPP
#define MART_LOG_HPP

#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace mart {
namespace loggers {

enum class level : std::uint32_t {
    debug,
    info,
    notice,
    warning,
    error,
};
std::ostream& operator<<(std::ostream&, const level&);

// nullopt for unknown names
std::optional<level> parse_level(const std::string& name);

using common_logger = boost::log::sources::severity_logger_mt<level>;
BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

namespace keyword {
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", level)
} // namespace keyword

// Installs a single console sink (stderr) filtered at min_level.
// Calling again replaces the previous sink.
void configure(level min_level);

// Drops every record; used by tests and quiet CLI runs
void disable();

} // namespace loggers
} // namespace mart

#define MART_LOG(log_level) \
    BOOST_LOG_SEV(::mart::loggers::generic::get(), ::mart::loggers::level::log_level)

#endif // MART_LOG_HPP
