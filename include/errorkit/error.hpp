#ifndef ERRORKIT_ERROR_HPP
#define ERRORKIT_ERROR_HPP

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>

namespace errorkit {

    class Error : public std::runtime_error {
      public:
        explicit Error(const std::string& message) : std::runtime_error(message) {}
        explicit Error(const char* message) : std::runtime_error(message) {}

        std::string message() const {
            return what();
        }
    };

    bool operator==(const Error& lhs, const Error& rhs);

    std::ostream& operator<<(std::ostream& out, const Error& error);

    using MaybeError = std::optional<Error>;

    // Typed results followed by the error slot.
    template <typename... Ts>
    using Outcome = std::tuple<Ts..., MaybeError>;

    std::string format_error(const MaybeError& error);

} // namespace errorkit

#endif // ERRORKIT_ERROR_HPP
