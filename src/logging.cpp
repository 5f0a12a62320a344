#include "errorkit/logging.hpp"

#include <atomic>

#include "errorkit/fault.hpp"

namespace errorkit {

    namespace {

        std::atomic<LogSink> active_sink{nullptr};

        std::string_view     file_basename(std::string_view path) {
            const auto slash = path.find_last_of("/\\");
            return slash == std::string_view::npos ? path : path.substr(slash + 1);
        }

        std::string_view level_prefix(LogLevel level) {
            switch (level) {
                case LogLevel::kDebug: return "[errorkit][debug] ";
                case LogLevel::kError: return "[errorkit] ";
            }
            return "[errorkit] ";
        }

        const char* flag(bool value) {
            return value ? "true" : "false";
        }

    } // namespace

    void set_log_sink(LogSink sink) {
        active_sink.store(sink);
    }

    void clear_log_sink() {
        active_sink.store(nullptr);
    }

    std::string format_entry(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location) {
        std::string entry(level_prefix(level));
        if (!context.empty()) {
            entry.append(context);
            entry.append(": ");
        }
        entry.append(message);
        entry.append(" @");
        entry.append(file_basename(location.file_name()));
        entry.push_back(':');
        entry.append(std::to_string(location.line()));
        return entry;
    }

    void log(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location) {
        const auto sink = active_sink.load();
        if (!sink) {
            return;
        }
        sink(level, format_entry(level, context, message, location));
    }

    void report_fault(const Options& options, std::string_view payload, std::string_view stack_trace, const std::source_location& location) noexcept {
        if (!options.log_faults && !options.debug_logging) {
            return;
        }
        try {
            if (options.log_faults) {
                log(LogLevel::kError, "safe_exec", std::string(kFaultPrefix).append(payload), location);
            }
            if (options.debug_logging) {
                log(LogLevel::kDebug, "safe_exec", make_fault_error(payload, stack_trace).message(), location);
            }
        } catch (...) {
            // A failing sink must not replace the fault being reported.
        }
    }

    void report_options(const Options& options, const std::source_location& location) {
        if (!options.debug_logging) {
            return;
        }
        std::string message = "capture_stack_trace=";
        message.append(flag(options.capture_stack_trace));
        message.append(" max_stack_frames=");
        message.append(std::to_string(options.max_stack_frames));
        message.append(" log_faults=");
        message.append(flag(options.log_faults));
        message.append(" debug_logging=");
        message.append(flag(options.debug_logging));
        log(LogLevel::kDebug, "options", message, location);
    }

} // namespace errorkit
