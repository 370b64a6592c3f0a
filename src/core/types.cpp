#include "core/types.hpp"

#include <type_traits>

// Implementation is entirely in the header for this simple types module.

namespace rollplan {

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(sizeof(ItemId) == 8, "ItemId must hold a full SQLite rowid");

} // namespace rollplan
