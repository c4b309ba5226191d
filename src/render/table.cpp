#include "codespaces/render/table.hpp"

#include "codespaces/common/fs.hpp"
#include "codespaces/listing/expiration.hpp"

#include <algorithm>
#include <array>
#include <ostream>
#include <vector>

namespace codespaces::render {

namespace {

constexpr const char *RESET = "\033[0m";
constexpr const char *BOLD = "\033[1m";
constexpr const char *DIM = "\033[2m";
constexpr const char *ITALIC = "\033[3m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *BLUE = "\033[34m";
constexpr const char *CYAN = "\033[36m";
constexpr const char *GRAY = "\033[90m";

constexpr const char *TITLE = "GitHub Codespaces";

enum class Align { Left, Center, Right };

struct Column {
  const char *header;
  const char *color;
  Align align;
};

struct Cell {
  std::string text;
  const char *color = nullptr;
};

constexpr std::size_t COLUMN_COUNT = 7;

constexpr std::array<Column, COLUMN_COUNT> COLUMNS = {{
    {"Display Name", CYAN, Align::Left},
    {"Repository", BLUE, Align::Left},
    {"State", nullptr, Align::Center},
    {"Expires In", nullptr, Align::Right},
    {"Last Used", DIM, Align::Left},
    {"Machine", DIM, Align::Left},
    {"Git Status", DIM, Align::Left},
}};

using Row = std::array<Cell, COLUMN_COUNT>;

const char *state_color(const std::string &state) {
  const std::string lower = common::to_lower(state);
  if (lower == "available") {
    return GREEN;
  }
  if (lower == "shutdown") {
    return YELLOW;
  }
  return RED;
}

const char *urgency_color(const listing::Urgency urgency) {
  switch (urgency) {
  case listing::Urgency::Green:
    return GREEN;
  case listing::Urgency::Yellow:
    return YELLOW;
  case listing::Urgency::Red:
    return RED;
  case listing::Urgency::Gray:
    break;
  }
  return GRAY;
}

std::string format_last_used(const std::optional<std::string> &last_used_at) {
  if (!last_used_at.has_value()) {
    return "Never";
  }
  if (const auto parsed = common::parse_iso8601(*last_used_at); parsed.has_value()) {
    return common::format_date_utc(*parsed);
  }
  // Keep the date part of an odd timestamp rather than hiding it.
  return last_used_at->substr(0, 10);
}

Row build_row(const api::Codespace &codespace, const common::Timestamp now) {
  const auto expiration = listing::compute_expiration(codespace, now);
  return Row{{
      {codespace.display_name, nullptr},
      {codespace.repository_name, nullptr},
      {codespace.state, state_color(codespace.state)},
      {expiration.label.value_or("Active"), urgency_color(expiration.urgency)},
      {format_last_used(codespace.last_used_at), nullptr},
      {codespace.machine_display_name.value_or("Unknown"), nullptr},
      {format_git_status(codespace.git_status), nullptr},
  }};
}

std::string repeat(const std::string &piece, std::size_t count) {
  std::string out;
  out.reserve(piece.size() * count);
  for (std::size_t i = 0; i < count; ++i) {
    out += piece;
  }
  return out;
}

class Painter {
public:
  Painter(std::ostream &out, bool color) : out_(out), color_(color) {}

  void styled(const std::string &text, const char *first, const char *second = nullptr) {
    if (color_ && (first != nullptr || second != nullptr)) {
      if (first != nullptr) {
        out_ << first;
      }
      if (second != nullptr) {
        out_ << second;
      }
      out_ << text << RESET;
      return;
    }
    out_ << text;
  }

  void cell(const std::string &text, std::size_t width, Align align, const char *color,
            const char *emphasis = nullptr) {
    const std::size_t used = display_width(text);
    const std::size_t gap = width > used ? width - used : 0;
    std::size_t left = 0;
    if (align == Align::Right) {
      left = gap;
    } else if (align == Align::Center) {
      left = gap / 2;
    }
    out_ << ' ' << std::string(left, ' ');
    styled(text, emphasis, color);
    out_ << std::string(gap - left, ' ') << ' ';
  }

  void rule(const std::array<std::size_t, COLUMN_COUNT> &widths, const char *left,
            const char *fill, const char *join, const char *right) {
    out_ << left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
      if (i > 0) {
        out_ << join;
      }
      out_ << repeat(fill, widths[i] + 2);
    }
    out_ << right << "\n";
  }

private:
  std::ostream &out_;
  bool color_;
};

} // namespace

std::string format_git_status(const api::GitStatus &status) {
  std::vector<std::string> parts;
  if (status.has_uncommitted_changes) {
    parts.emplace_back("uncommitted");
  }
  if (status.has_unpushed_changes) {
    parts.emplace_back("unpushed");
  }
  if (status.ahead > 0) {
    parts.push_back("↑" + std::to_string(status.ahead));
  }
  if (status.behind > 0) {
    parts.push_back("↓" + std::to_string(status.behind));
  }
  if (parts.empty()) {
    return "clean";
  }

  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += parts[i];
  }
  return out;
}

std::size_t display_width(const std::string_view text) {
  return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
  }));
}

void render_table(const listing::CodespaceRefs &codespaces, std::ostream &out,
                  const TableStyle &style, const common::Timestamp now) {
  Painter painter(out, style.color);
  if (codespaces.empty()) {
    painter.styled("No codespaces found matching your criteria.", YELLOW);
    out << "\n";
    return;
  }

  std::vector<Row> rows;
  rows.reserve(codespaces.size());
  for (const auto *codespace : codespaces) {
    rows.push_back(build_row(*codespace, now));
  }

  std::array<std::size_t, COLUMN_COUNT> widths{};
  for (std::size_t i = 0; i < COLUMN_COUNT; ++i) {
    widths[i] = display_width(COLUMNS[i].header);
    for (const auto &row : rows) {
      widths[i] = std::max(widths[i], display_width(row[i].text));
    }
  }

  std::size_t total_width = COLUMN_COUNT + 1;
  for (const auto width : widths) {
    total_width += width + 2;
  }
  const std::size_t title_width = display_width(TITLE);
  out << std::string(total_width > title_width ? (total_width - title_width) / 2 : 0, ' ');
  painter.styled(TITLE, ITALIC);
  out << "\n";

  painter.rule(widths, "┏", "━", "┳", "┓");
  out << "┃";
  for (std::size_t i = 0; i < COLUMN_COUNT; ++i) {
    if (i > 0) {
      out << "┃";
    }
    painter.cell(COLUMNS[i].header, widths[i], COLUMNS[i].align, nullptr, BOLD);
  }
  out << "┃\n";
  painter.rule(widths, "┡", "━", "╇", "┩");

  for (std::size_t r = 0; r < rows.size(); ++r) {
    if (r > 0) {
      painter.rule(widths, "├", "─", "┼", "┤");
    }
    out << "│";
    for (std::size_t i = 0; i < COLUMN_COUNT; ++i) {
      if (i > 0) {
        out << "│";
      }
      const auto &cell = rows[r][i];
      painter.cell(cell.text, widths[i], COLUMNS[i].align,
                   cell.color != nullptr ? cell.color : COLUMNS[i].color);
    }
    out << "│\n";
  }
  painter.rule(widths, "└", "─", "┴", "┘");

  out << "\n";
  painter.styled("Total: " + std::to_string(rows.size()) + " codespace(s)", DIM);
  out << "\n";
}

} // namespace codespaces::render
