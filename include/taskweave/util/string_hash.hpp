#pragma once

#include <ankerl/unordered_dense.h>

#include <functional>
#include <string>
#include <string_view>

namespace taskweave {

// Transparent string hash for heterogeneous lookup
struct StringHash {
  using is_transparent = void;
  using is_avalanching = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::uint64_t {
    return ankerl::unordered_dense::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

/// Name-keyed map that accepts std::string_view lookups. Iterates in
/// insertion order.
template <typename V>
using StringMap =
    ankerl::unordered_dense::map<std::string, V, StringHash, StringEqual>;

} // namespace taskweave
