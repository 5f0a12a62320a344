#include "errorkit/options.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>

#include <nlohmann/json.hpp>

#include "errorkit/logging.hpp"

namespace errorkit {

    namespace {

        std::mutex options_mutex;
        Options    active_options;

        std::expected<std::optional<bool>, std::string> bool_field(const nlohmann::json& obj, const char* key) {
            if (!obj.contains(key) || obj.at(key).is_null()) {
                return std::nullopt;
            }
            if (!obj.at(key).is_boolean()) {
                return std::unexpected(std::string(key) + " must be a boolean");
            }
            return obj.at(key).get<bool>();
        }

        std::expected<std::optional<int>, std::string> positive_int_field(const nlohmann::json& obj, const char* key) {
            if (!obj.contains(key) || obj.at(key).is_null()) {
                return std::nullopt;
            }
            if (!obj.at(key).is_number_integer()) {
                return std::unexpected(std::string(key) + " must be an integer");
            }
            const auto raw = obj.at(key).get<int64_t>();
            if (raw <= 0 || raw > kMaxStackFrames) {
                return std::unexpected(std::string(key) + " must be between 1 and " + std::to_string(kMaxStackFrames));
            }
            return static_cast<int>(raw);
        }

    } // namespace

    Options apply_overrides(const Options& base, const OptionsOverrides& overrides) {
        Options merged = base;
        if (overrides.capture_stack_trace) {
            merged.capture_stack_trace = *overrides.capture_stack_trace;
        }
        if (overrides.max_stack_frames) {
            merged.max_stack_frames = *overrides.max_stack_frames;
        }
        if (overrides.log_faults) {
            merged.log_faults = *overrides.log_faults;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        return merged;
    }

    std::expected<OptionsOverrides, std::string> parse_options_overrides(std::string_view json_text) {
        const auto json = nlohmann::json::parse(json_text, nullptr, false);
        if (json.is_discarded()) {
            return std::unexpected(std::string("options: invalid json"));
        }
        if (!json.is_object()) {
            return std::unexpected(std::string("options: expected an object"));
        }

        OptionsOverrides overrides;
        const auto       capture_stack_trace = bool_field(json, "capture_stack_trace");
        if (!capture_stack_trace) {
            return std::unexpected("options: " + capture_stack_trace.error());
        }
        overrides.capture_stack_trace = *capture_stack_trace;

        const auto max_stack_frames = positive_int_field(json, "max_stack_frames");
        if (!max_stack_frames) {
            return std::unexpected("options: " + max_stack_frames.error());
        }
        overrides.max_stack_frames = *max_stack_frames;

        const auto log_faults = bool_field(json, "log_faults");
        if (!log_faults) {
            return std::unexpected("options: " + log_faults.error());
        }
        overrides.log_faults = *log_faults;

        const auto debug_logging = bool_field(json, "debug_logging");
        if (!debug_logging) {
            return std::unexpected("options: " + debug_logging.error());
        }
        overrides.debug_logging = *debug_logging;
        return overrides;
    }

    void configure(const Options& options) {
        Options clamped          = options;
        clamped.max_stack_frames = std::clamp(options.max_stack_frames, 1, kMaxStackFrames);
        {
            std::lock_guard lock(options_mutex);
            active_options = clamped;
        }
        report_options(clamped);
    }

    Options current_options() {
        std::lock_guard lock(options_mutex);
        return active_options;
    }

    void reset_options() {
        configure(Options{});
    }

} // namespace errorkit
