#include "errorkit/fault.hpp"

#include <execinfo.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <memory>
#include <new>
#include <sstream>
#include <type_traits>
#include <vector>

#include "errorkit/logging.hpp"
#include "errorkit/options.hpp"

namespace errorkit {

    namespace {

        constexpr const char* kFallbackFaultMessage = "panic occurred: unknown exception\nStack trace:\n<stack trace disabled>";

        template <typename T>
        std::string stream_text(const T& value) {
            std::ostringstream out;
            out << value;
            return out.str();
        }

        template <typename T>
        std::string decimal_text(T value) {
            if constexpr (std::is_signed_v<T>) {
                return std::to_string(static_cast<long long>(value));
            } else {
                return std::to_string(static_cast<unsigned long long>(value));
            }
        }

        std::string stack_text(const Options& options) {
            if (!options.capture_stack_trace) {
                return std::string(kStackTraceDisabled);
            }
            try {
                return capture_stack_trace(options.max_stack_frames);
            } catch (const std::bad_alloc&) { return std::string(kStackTraceUnavailable); }
        }

    } // namespace

    std::string describe_current_exception() {
        const auto current = std::current_exception();
        if (!current) {
            return std::string(kUnknownFaultPayload);
        }
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& ex) {
            return ex.what();
        } catch (const std::string& text) {
            return text;
        } catch (std::string_view text) {
            return std::string(text);
        } catch (const char* text) {
            return text ? std::string(text) : std::string{};
        } catch (bool value) {
            return value ? "true" : "false";
        } catch (char value) {
            return std::string(1, value);
        } catch (signed char value) {
            return decimal_text(value);
        } catch (unsigned char value) {
            return decimal_text(value);
        } catch (wchar_t value) {
            return decimal_text(value);
        } catch (char8_t value) {
            return decimal_text(value);
        } catch (char16_t value) {
            return decimal_text(value);
        } catch (char32_t value) {
            return decimal_text(value);
        } catch (short value) {
            return decimal_text(value);
        } catch (unsigned short value) {
            return decimal_text(value);
        } catch (int value) {
            return std::to_string(value);
        } catch (long value) {
            return std::to_string(value);
        } catch (long long value) {
            return std::to_string(value);
        } catch (unsigned value) {
            return std::to_string(value);
        } catch (unsigned long value) {
            return std::to_string(value);
        } catch (unsigned long long value) {
            return std::to_string(value);
        } catch (float value) {
            return stream_text(value);
        } catch (double value) {
            return stream_text(value);
        } catch (long double value) {
            return stream_text(value);
        } catch (...) {
            return std::string(kUnknownFaultPayload);
        }
    }

    std::string capture_stack_trace(int max_frames) {
        if (max_frames <= 0) {
            return {};
        }
        max_frames = std::min(max_frames, kMaxStackFrames);
        // One extra slot for this function's own frame, which is skipped.
        std::vector<void*> frames(static_cast<size_t>(max_frames) + 1);
        const int          depth = ::backtrace(frames.data(), static_cast<int>(frames.size()));
        std::unique_ptr<char*, decltype(&std::free)> symbols(::backtrace_symbols(frames.data(), depth), &std::free);

        std::string                                  text;
        for (int i = 1; i < depth; ++i) {
            if (!text.empty()) {
                text.push_back('\n');
            }
            if (symbols) {
                text.append(symbols.get()[i]);
            } else {
                text.append(stream_text(frames[static_cast<size_t>(i)]));
            }
        }
        return text;
    }

    Error make_fault_error(std::string_view payload, std::string_view stack_trace) {
        std::string text;
        text.reserve(kFaultPrefix.size() + payload.size() + kStackTraceHeader.size() + stack_trace.size());
        text.append(kFaultPrefix);
        text.append(payload);
        text.append(kStackTraceHeader);
        text.append(stack_trace);
        return Error(text);
    }

    Error recover_current_exception() noexcept {
        try {
            const auto options = current_options();
            const auto payload = describe_current_exception();
            const auto stack   = stack_text(options);
            report_fault(options, payload, stack);
            return make_fault_error(payload, stack);
        } catch (...) {
            // Out of memory while describing the payload or building the message.
            return Error(kFallbackFaultMessage);
        }
    }

} // namespace errorkit
