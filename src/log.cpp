// =============================================================================
// log.cpp - Boost.Log Setup
// =============================================================================

#include "mart/log.hpp"

#include <boost/log/core/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <mutex>

namespace mart {
namespace loggers {

BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

namespace {

using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

std::mutex sink_mutex;
boost::shared_ptr<console_sink> current_sink;

} // namespace

std::ostream& operator<<(std::ostream& os, const level& l) {
    switch (l) {
        case level::debug:   return os << "debug";
        case level::info:    return os << "info";
        case level::notice:  return os << "notice";
        case level::warning: return os << "warning";
        case level::error:   return os << "error";
    }
    return os << static_cast<std::uint32_t>(l);
}

std::optional<level> parse_level(const std::string& name) {
    if (name == "debug")   return level::debug;
    if (name == "info")    return level::info;
    if (name == "notice")  return level::notice;
    if (name == "warning" || name == "warn") return level::warning;
    if (name == "error")   return level::error;
    return std::nullopt;
}

void configure(level min_level) {
    namespace expr = boost::log::expressions;

    std::lock_guard<std::mutex> lock(sink_mutex);
    auto core = boost::log::core::get();
    if (current_sink) {
        core->remove_sink(current_sink);
    }

    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    current_sink = boost::make_shared<console_sink>(backend);
    current_sink->set_formatter(
        expr::stream << "[" << keyword::severity << "] " << expr::smessage);

    core->add_sink(current_sink);
    core->set_filter(keyword::severity >= min_level);
    core->set_logging_enabled(true);
}

void disable() {
    boost::log::core::get()->set_logging_enabled(false);
}

} // namespace loggers
} // namespace mart
