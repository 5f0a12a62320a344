#ifndef ERRORKIT_VALIDATE_HPP
#define ERRORKIT_VALIDATE_HPP

#include <string_view>

#include <boost/format.hpp>

#include "errorkit/error.hpp"

namespace errorkit {

    namespace detail {

        // Parses the template with every boost::io error bit cleared, so a bad
        // directive or a wrong argument count renders instead of throwing.
        boost::format make_lenient_format(std::string_view format);

    } // namespace detail

    template <typename... Args>
    [[nodiscard]] MaybeError validate(bool condition, std::string_view format, const Args&... args) {
        if (condition) {
            return std::nullopt;
        }
        auto formatter = detail::make_lenient_format(format);
        (void)(formatter % ... % args);
        return Error(formatter.str());
    }

} // namespace errorkit

#endif // ERRORKIT_VALIDATE_HPP
