#pragma once

#include "codespaces/api/codespace.hpp"
#include "codespaces/common/time.hpp"
#include "codespaces/listing/filter.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace codespaces::render {

struct TableStyle {
  /// Emit ANSI SGR sequences.
  bool color = false;
};

/// "uncommitted, unpushed, ↑<ahead>, ↓<behind>" (present parts only) or "clean".
[[nodiscard]] std::string format_git_status(const api::GitStatus &status);

/// Terminal columns taken by a UTF-8 string (one per code point).
[[nodiscard]] std::size_t display_width(std::string_view text);

void render_table(const listing::CodespaceRefs &codespaces, std::ostream &out,
                  const TableStyle &style, common::Timestamp now);

} // namespace codespaces::render
