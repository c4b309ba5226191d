#include "codespaces/listing/filter.hpp"

#include "codespaces/common/fs.hpp"
#include "codespaces/listing/expiration.hpp"

namespace codespaces::listing {

CodespaceRefs as_refs(const std::vector<api::Codespace> &codespaces) {
  CodespaceRefs refs;
  refs.reserve(codespaces.size());
  for (const auto &codespace : codespaces) {
    refs.push_back(&codespace);
  }
  return refs;
}

bool matches(const api::Codespace &codespace, const FilterOptions &options,
             const common::Timestamp now) {
  if (options.repo.has_value() && !options.repo->empty() &&
      !common::contains_ignore_case(codespace.repository_name, *options.repo)) {
    return false;
  }

  if (options.state.has_value() && !options.state->empty() &&
      !common::equals_ignore_case(codespace.state, *options.state)) {
    return false;
  }

  if (options.max_days.has_value()) {
    const auto expires_at = expiration_time(codespace);
    if (!expires_at.has_value()) {
      return false;
    }
    if (whole_days_until(*expires_at, now) > *options.max_days) {
      return false;
    }
  }

  return true;
}

CodespaceRefs filter_codespaces(const CodespaceRefs &codespaces, const FilterOptions &options,
                                const common::Timestamp now) {
  CodespaceRefs out;
  for (const auto *codespace : codespaces) {
    if (codespace != nullptr && matches(*codespace, options, now)) {
      out.push_back(codespace);
    }
  }
  return out;
}

} // namespace codespaces::listing
