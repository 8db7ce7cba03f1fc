#include <bitmem/log.hpp>

namespace bitmem::detail {

log_level& global_log_level() noexcept {
    static log_level lvl = log_level::warn;
    return lvl;
}

} // namespace bitmem::detail
