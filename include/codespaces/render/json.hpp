#pragma once

#include "codespaces/common/time.hpp"
#include "codespaces/listing/filter.hpp"

#include <iosfwd>
#include <string>

namespace codespaces::render {

inline constexpr const char *EXPIRES_IN_FIELD = "_expires_in";
inline constexpr const char *EXPIRES_TIMESTAMP_FIELD = "_expires_timestamp";

/// Upstream objects plus "_expires_in" and "_expires_timestamp" (null when the
/// codespace does not expire), as a 2-space indented array.
[[nodiscard]] std::string to_json(const listing::CodespaceRefs &codespaces,
                                  common::Timestamp now);

void render_json(const listing::CodespaceRefs &codespaces, std::ostream &out,
                 common::Timestamp now);

} // namespace codespaces::render
