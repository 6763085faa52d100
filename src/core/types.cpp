#include "core/types.hpp"

#include <type_traits>

// Uuid and Timestamp are header-only; these checks pin their layout.

namespace folio {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

} // namespace folio
