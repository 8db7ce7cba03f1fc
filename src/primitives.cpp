#include <bitmem/primitives.hpp>

namespace bitmem::detail {

std::string range_error_message(bool is_signed,
                                const std::string& min,
                                const std::string& max,
                                const std::string& received) {
    std::string msg = is_signed ? "Value must be a signed integer in range ["
                                : "Value must be an unsigned integer in range [";
    msg += min;
    msg += ", ";
    msg += max;
    msg += "], received: ";
    msg += received;
    return msg;
}

} // namespace bitmem::detail
