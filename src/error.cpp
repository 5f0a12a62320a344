#include "errorkit/error.hpp"

#include <string_view>

namespace errorkit {

    bool operator==(const Error& lhs, const Error& rhs) {
        return std::string_view(lhs.what()) == std::string_view(rhs.what());
    }

    std::ostream& operator<<(std::ostream& out, const Error& error) {
        return out << error.what();
    }

    std::string format_error(const MaybeError& error) {
        if (!error) {
            return "<nil>";
        }
        return error->message();
    }

} // namespace errorkit
