#ifndef ERRORKIT_LOGGING_HPP
#define ERRORKIT_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

#include "errorkit/options.hpp"

namespace errorkit {

    enum class LogLevel {
        kDebug,
        kError,
    };

    using LogSink = void (*)(LogLevel level, std::string_view entry);

    // Process-wide; may be swapped while other threads are logging.
    void        set_log_sink(LogSink sink);
    void        clear_log_sink();

    // "[errorkit] <context>: <message> @<file>:<line>", with "[errorkit][debug]"
    // for debug entries. The context part is omitted when empty.
    std::string format_entry(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location);

    void        log(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    // Reports a captured fault: an error entry with the payload when
    // options.log_faults is set, a debug entry with payload and stack when
    // options.debug_logging is set. Sink failures are dropped.
    void report_fault(const Options& options, std::string_view payload, std::string_view stack_trace,
                      const std::source_location& location = std::source_location::current()) noexcept;

    void report_options(const Options& options, const std::source_location& location = std::source_location::current());

} // namespace errorkit

#endif // ERRORKIT_LOGGING_HPP
