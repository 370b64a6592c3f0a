#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <vector>

#include "core/changelog.hpp"
#include "core/project_id.hpp"
#include "core/result.hpp"
#include "core/rolling_plan.hpp"
#include "core/search.hpp"
#include "core/work_item.hpp"

namespace rollplan::cli {

// JSON shapes printed by the rollplan command. Absent optional fields are
// written as null; timestamps as ISO 8601 UTC strings.

[[nodiscard]] QJsonObject to_json(const ProjectIdentity& identity);
[[nodiscard]] QJsonObject to_json(const WorkItem& item);

// Collapsed: {id, title, type, status, collapsed: true, summary}
// Expanded:  the item fields plus {collapsed: false, progress?, children}
[[nodiscard]] QJsonObject to_json(const PlanNode& node);
[[nodiscard]] QJsonObject to_json(const WorkPlan& plan);
[[nodiscard]] QJsonObject to_json(const SearchHit& hit);

// details is embedded as an object when it parses, as a string otherwise.
[[nodiscard]] QJsonObject to_json(const ChangelogEntry& entry);

[[nodiscard]] QJsonArray to_json(const std::vector<ChangelogEntry>& entries);

// {"error": {"kind", "reason"?, "message"}}
[[nodiscard]] QJsonObject error_to_json(const Error& error);

[[nodiscard]] QString to_text(const QJsonObject& obj);

} // namespace rollplan::cli
