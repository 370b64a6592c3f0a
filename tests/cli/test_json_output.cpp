#include <catch2/catch_test_macros.hpp>

#include <QJsonArray>
#include <QJsonDocument>

#include "cli/json_output.hpp"
#include "storage/changelog_details.hpp"

using namespace rollplan;
using namespace rollplan::cli;

namespace {

WorkItem sample_item() {
    WorkItem item;
    item.id = 12;
    item.project_id = "cHJvag==";
    item.type = ItemType::Task;
    item.title = "Draft";
    item.status = ItemStatus::InProgress;
    item.parent_id = 3;
    item.order_index = 21.0;
    item.created_at = Timestamp(0);
    item.updated_at = Timestamp(1500);
    return item;
}

} // namespace

TEST_CASE("JSON: work item fields", "[cli][json]") {
    const auto obj = to_json(sample_item());

    REQUIRE(obj.value(QStringLiteral("id")).toInteger() == 12);
    REQUIRE(obj.value(QStringLiteral("type")).toString() == QStringLiteral("task"));
    REQUIRE(obj.value(QStringLiteral("status")).toString() == QStringLiteral("in_progress"));
    REQUIRE(obj.value(QStringLiteral("parent_id")).toInteger() == 3);
    REQUIRE(obj.value(QStringLiteral("description")).isNull());
    REQUIRE(obj.value(QStringLiteral("notes")).isNull());
    REQUIRE(obj.value(QStringLiteral("order_index")).toDouble() == 21.0);
    REQUIRE(obj.value(QStringLiteral("created_at")).toString() == QStringLiteral("1970-01-01T00:00:00.000Z"));
    REQUIRE(obj.value(QStringLiteral("updated_at")).toString() == QStringLiteral("1970-01-01T00:00:01.500Z"));
}

TEST_CASE("JSON: collapsed and expanded plan nodes", "[cli][json]") {
    PlanNode collapsed;
    collapsed.id = 4;
    collapsed.title = "Research";
    collapsed.type = ItemType::Phase;
    collapsed.status = ItemStatus::Completed;
    collapsed.collapsed = true;
    collapsed.summary_text = "1 of 1 tasks completed";

    const auto c = to_json(collapsed);
    REQUIRE(c.value(QStringLiteral("collapsed")).toBool());
    REQUIRE(c.value(QStringLiteral("summary")).toString() == QStringLiteral("1 of 1 tasks completed"));
    REQUIRE_FALSE(c.contains(QStringLiteral("children")));

    PlanNode expanded;
    expanded.id = 12;
    expanded.item = sample_item();
    expanded.progress_text = "1 of 2 subtasks completed";
    expanded.children.push_back(collapsed);

    const auto e = to_json(expanded);
    REQUIRE_FALSE(e.value(QStringLiteral("collapsed")).toBool());
    REQUIRE(e.value(QStringLiteral("title")).toString() == QStringLiteral("Draft"));
    REQUIRE(e.value(QStringLiteral("progress")).toString() == QStringLiteral("1 of 2 subtasks completed"));
    REQUIRE(e.value(QStringLiteral("children")).toArray().size() == 1);
}

TEST_CASE("JSON: changelog details are embedded as objects", "[cli][json]") {
    ChangelogEntry entry;
    entry.id = 1;
    entry.work_item_id = 12;
    entry.project_id = "p";
    entry.action = ChangeAction::FieldChange;
    entry.details = R"({"field":"title","old":"a","new":"b"})";

    const auto obj = to_json(entry);
    REQUIRE(obj.value(QStringLiteral("action")).toString() == QStringLiteral("field-change"));
    const auto details = obj.value(QStringLiteral("details")).toObject();
    REQUIRE(details.value(QStringLiteral("field")).toString() == QStringLiteral("title"));
    REQUIRE(details.value(QStringLiteral("new")).toString() == QStringLiteral("b"));

    entry.details = "not json";
    REQUIRE(to_json(entry).value(QStringLiteral("details")).toString() == QStringLiteral("not json"));
}

TEST_CASE("JSON: stored details with quotes and backslashes parse back", "[cli][json]") {
    auto item = sample_item();
    item.title = R"(C:\dir "quoted")";
    item.description = "two\nlines";

    ChangelogEntry entry;
    entry.action = ChangeAction::Create;
    entry.details = storage::create_details(item);

    const auto created = to_json(entry).value(QStringLiteral("details")).toObject();
    REQUIRE(created.value(QStringLiteral("title")).toString() == QString::fromUtf8(R"(C:\dir "quoted")"));
    REQUIRE(created.value(QStringLiteral("description")).toString() == QStringLiteral("two\nlines"));
    REQUIRE(created.value(QStringLiteral("parent_id")).toInteger() == 3);

    entry.action = ChangeAction::FieldChange;
    entry.details = storage::field_change_details("title", "\"old\"",
                                                  storage::field_value_json(item, fields::Title{}));
    const auto changed = to_json(entry).value(QStringLiteral("details")).toObject();
    REQUIRE(changed.value(QStringLiteral("new")).toString() == QString::fromUtf8(R"(C:\dir "quoted")"));
}

TEST_CASE("JSON: errors carry kind, reason and message", "[cli][json]") {
    const auto obj = error_to_json(Error::invalid_hierarchy("bad-nesting", "subtask items cannot be children of project"));
    const auto inner = obj.value(QStringLiteral("error")).toObject();

    REQUIRE(inner.value(QStringLiteral("kind")).toString() == QStringLiteral("invalid_hierarchy"));
    REQUIRE(inner.value(QStringLiteral("reason")).toString() == QStringLiteral("bad-nesting"));
    REQUIRE(inner.value(QStringLiteral("message")).toString().startsWith(QStringLiteral("subtask")));

    const auto plain = error_to_json(Error::not_found("gone")).value(QStringLiteral("error")).toObject();
    REQUIRE_FALSE(plain.contains(QStringLiteral("reason")));
}

TEST_CASE("JSON: text output parses back", "[cli][json]") {
    const auto text = to_text(to_json(ProjectIdentity{.project_id = "YQ==", .raw_value = "a"}));
    const auto doc = QJsonDocument::fromJson(text.toUtf8());
    REQUIRE(doc.isObject());
    REQUIRE(doc.object().value(QStringLiteral("project_id")).toString() == QStringLiteral("YQ=="));
    REQUIRE(doc.object().value(QStringLiteral("raw_value")).toString() == QStringLiteral("a"));
}
