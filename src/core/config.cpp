#include "pepcheck/core/config.hpp"
#include "pepcheck/core/text_utils.hpp"

namespace pepcheck {

auto CheckerConfig::is_ignored(std::string_view code) const -> bool {
    return starts_with_any(code, ignore) && !starts_with_any(code, select);
}

} // namespace pepcheck
