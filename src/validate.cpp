#include "errorkit/validate.hpp"

#include <string>

namespace errorkit::detail {

    boost::format make_lenient_format(std::string_view format) {
        boost::format formatter;
        formatter.exceptions(boost::io::no_error_bits);
        formatter.parse(std::string(format));
        return formatter;
    }

} // namespace errorkit::detail
