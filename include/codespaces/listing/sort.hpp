#pragma once

#include "codespaces/listing/filter.hpp"

namespace codespaces::listing {

/// Stable ascending order by expiration. Records without one sort last, as if
/// they expired at the end of time.
void sort_by_expiration(CodespaceRefs &codespaces);

} // namespace codespaces::listing
