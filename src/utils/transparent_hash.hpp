#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace inference_gateway {

// Heterogeneous lookup for string-keyed unordered containers, so model,
// runner and request ids arriving as std::string_view do not allocate on
// lookup.
struct TransparentHash {
  using is_transparent = void;

  auto operator()(std::string_view key) const noexcept -> std::size_t
  {
    return std::hash<std::string_view>{}(key);
  }
};

template <typename Value>
using StringMap =
    std::unordered_map<std::string, Value, TransparentHash, std::equal_to<>>;

using StringSet =
    std::unordered_set<std::string, TransparentHash, std::equal_to<>>;

}  // namespace inference_gateway
