#pragma once

#include "codespaces/api/codespace.hpp"
#include "codespaces/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codespaces::listing {

/// Borrowed view over records owned by the caller.
using CodespaceRefs = std::vector<const api::Codespace *>;

[[nodiscard]] CodespaceRefs as_refs(const std::vector<api::Codespace> &codespaces);

struct FilterOptions {
  /// Case-insensitive substring of the repository name.
  std::optional<std::string> repo;
  /// Case-insensitive state equality.
  std::optional<std::string> state;
  /// Keep records that expire and whose whole-day count until expiry is at
  /// most this value. Already-expired records have a negative count.
  std::optional<std::int64_t> max_days;
};

[[nodiscard]] bool matches(const api::Codespace &codespace, const FilterOptions &options,
                           common::Timestamp now);

/// Logical AND of every supplied filter, input order preserved.
[[nodiscard]] CodespaceRefs filter_codespaces(const CodespaceRefs &codespaces,
                                              const FilterOptions &options,
                                              common::Timestamp now);

} // namespace codespaces::listing
