#include "codespaces/listing/sort.hpp"

#include "codespaces/listing/expiration.hpp"

#include <algorithm>
#include <utility>

namespace codespaces::listing {

void sort_by_expiration(CodespaceRefs &codespaces) {
  std::vector<std::pair<common::Timestamp, const api::Codespace *>> keyed;
  keyed.reserve(codespaces.size());
  for (const auto *codespace : codespaces) {
    keyed.emplace_back(expiration_time(*codespace).value_or(common::Timestamp::max()), codespace);
  }

  std::stable_sort(keyed.begin(), keyed.end(),
                   [](const auto &lhs, const auto &rhs) { return lhs.first < rhs.first; });

  for (std::size_t i = 0; i < keyed.size(); ++i) {
    codespaces[i] = keyed[i].second;
  }
}

} // namespace codespaces::listing
