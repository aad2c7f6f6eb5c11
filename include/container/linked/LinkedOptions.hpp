#pragma once
#include <OptionsPack.hpp>

namespace container {

/// Options for the linked containers
struct LinkedListOption {
  struct PrettyJson{};      ///< toJson() emits indented output
  struct LenientJson{};     ///< fromJson() accepts comments and trailing commas
};

} // namespace container
