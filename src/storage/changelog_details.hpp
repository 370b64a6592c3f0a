#pragma once

#include "core/work_item.hpp"
#include <string>
#include <string_view>

namespace rollplan::storage {

/**
 * JSON payloads stored in changelog.details.
 *
 *   create        {"type","title","parent_id","description"}
 *   field-change  {"field","old","new"}
 *   complete      {"title","previous_status"}
 */
[[nodiscard]] std::string escape_json_string(std::string_view s);

[[nodiscard]] std::string create_details(const WorkItem& item);

[[nodiscard]] std::string field_change_details(std::string_view field,
                                               const std::string& old_json,
                                               const std::string& new_json);

[[nodiscard]] std::string complete_details(const WorkItem& item, ItemStatus previous_status);

/**
 * Current value of the field targeted by update, rendered as a JSON
 * value ("text", null, 3, 12.5). Two renderings compare equal exactly
 * when the field values do.
 */
[[nodiscard]] std::string field_value_json(const WorkItem& item, const FieldUpdate& update);

} // namespace rollplan::storage
