#include "codespaces/render/json.hpp"

#include "codespaces/common/json_util.hpp"
#include "codespaces/listing/expiration.hpp"

#include <ostream>

namespace codespaces::render {

std::string to_json(const listing::CodespaceRefs &codespaces, const common::Timestamp now) {
  std::string array = "[";
  for (std::size_t i = 0; i < codespaces.size(); ++i) {
    const auto &codespace = *codespaces[i];
    const auto expiration = listing::compute_expiration(codespace, now);

    const std::string expires_in =
        expiration.label.has_value() ? common::json_quote(*expiration.label) : "null";
    const std::string expires_timestamp =
        expiration.expires_at.has_value()
            ? common::json_quote(common::format_iso8601_utc(*expiration.expires_at))
            : "null";

    const std::string object = codespace.raw_json.empty() ? "{}" : codespace.raw_json;
    if (i > 0) {
      array += ",";
    }
    array += common::json_append_fields(object, {{EXPIRES_IN_FIELD, expires_in},
                                                 {EXPIRES_TIMESTAMP_FIELD, expires_timestamp}});
  }
  array += "]";
  return common::json_pretty(array, 2);
}

void render_json(const listing::CodespaceRefs &codespaces, std::ostream &out,
                 const common::Timestamp now) {
  out << to_json(codespaces, now) << "\n";
}

} // namespace codespaces::render
