#ifndef ERRORKIT_OPTIONS_HPP
#define ERRORKIT_OPTIONS_HPP

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace errorkit {

    inline constexpr int kMaxStackFrames = 4096;

    struct Options {
        bool capture_stack_trace = true;
        int  max_stack_frames    = 64;
        bool log_faults          = false;
        bool debug_logging       = false;
    };

    struct OptionsOverrides {
        std::optional<bool> capture_stack_trace;
        std::optional<int>  max_stack_frames;
        std::optional<bool> log_faults;
        std::optional<bool> debug_logging;
    };

    Options                                      apply_overrides(const Options& base, const OptionsOverrides& overrides);
    std::expected<OptionsOverrides, std::string> parse_options_overrides(std::string_view json_text);

    // max_stack_frames is clamped to [1, kMaxStackFrames].
    void                                         configure(const Options& options);
    Options                                      current_options();
    void                                         reset_options();

} // namespace errorkit

#endif // ERRORKIT_OPTIONS_HPP
