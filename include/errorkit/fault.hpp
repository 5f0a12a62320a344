#ifndef ERRORKIT_FAULT_HPP
#define ERRORKIT_FAULT_HPP

#include <string>
#include <string_view>

#include "errorkit/error.hpp"

namespace errorkit {

    inline constexpr std::string_view kFaultPrefix           = "panic occurred: ";
    inline constexpr std::string_view kStackTraceHeader      = "\nStack trace:\n";
    inline constexpr std::string_view kStackTraceDisabled    = "<stack trace disabled>";
    inline constexpr std::string_view kStackTraceUnavailable = "<stack trace unavailable>";
    inline constexpr std::string_view kUnknownFaultPayload   = "unknown exception";

    // Text of the exception currently being handled. Only meaningful inside a
    // catch block; returns kUnknownFaultPayload for payloads it cannot print.
    std::string describe_current_exception();

    // One symbolised frame per line, innermost first, starting at the caller.
    // max_frames is capped at kMaxStackFrames.
    std::string capture_stack_trace(int max_frames);

    Error       make_fault_error(std::string_view payload, std::string_view stack_trace);

    // Builds the captured-fault error for the in-flight exception, honouring
    // the process-wide options. A failed stack capture or log sink never
    // costs the payload text.
    Error recover_current_exception() noexcept;

} // namespace errorkit

#endif // ERRORKIT_FAULT_HPP
