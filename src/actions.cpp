#include "wsim/actions.hpp"

namespace wsim {

std::optional<ActionKind> parse_action_kind(std::string_view s) noexcept {
  for (uint8_t i = 0; i < std::variant_size_v<ActionPayload>; ++i) {
    const auto k = static_cast<ActionKind>(i);
    if (to_string(k) == s) return k;
  }
  return std::nullopt;
}

} // namespace wsim
