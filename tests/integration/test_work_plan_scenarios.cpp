#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "service/task_service.hpp"
#include "core/hierarchy.hpp"

using namespace rollplan;
using namespace rollplan::storage;
using namespace rollplan::service;

namespace {

struct ServiceFixture {
    Database db = Database::open_memory().unwrap();
    TaskService service{db};
    ProjectId project;

    ServiceFixture() {
        REQUIRE(initialize_database(db).is_ok());
        project = service.identify("https://example.com/team/app.git").unwrap().project_id;
    }

    WorkItem add(ItemType type, std::string title, std::optional<ItemId> parent = std::nullopt) {
        auto created = service.create_work_item(NewWorkItem{
            .project_id = project, .type = type, .title = std::move(title), .parent_id = parent});
        REQUIRE(created.is_ok());
        return std::move(created).unwrap();
    }
};

} // namespace

TEST_CASE("Scenario: open work is shown expanded", "[integration][scenario]") {
    ServiceFixture f;
    auto p = f.add(ItemType::Project, "P");
    auto research = f.add(ItemType::Phase, "Research", p.id);
    auto draft = f.add(ItemType::Task, "Draft", research.id);

    auto plan = f.service.get_current_work_plan(f.project).unwrap();
    REQUIRE(plan.project_id == f.project);
    REQUIRE(plan.roots.size() == 1);

    const auto& root = plan.roots[0];
    REQUIRE(root.id == p.id);
    REQUIRE_FALSE(root.collapsed);
    REQUIRE(root.children.at(0).id == research.id);
    REQUIRE_FALSE(root.children.at(0).collapsed);
    REQUIRE(root.children.at(0).children.at(0).id == draft.id);
    REQUIRE_FALSE(root.children.at(0).children.at(0).collapsed);
}

TEST_CASE("Scenario: finished phase collapses into a summary", "[integration][scenario]") {
    ServiceFixture f;
    auto p = f.add(ItemType::Project, "P");
    auto research = f.add(ItemType::Phase, "Research", p.id);
    auto draft = f.add(ItemType::Task, "Draft", research.id);

    REQUIRE(f.service.complete_item(draft.id, f.project).is_ok());
    REQUIRE(f.service.complete_item(research.id, f.project).is_ok());

    auto plan = f.service.get_current_work_plan(f.project).unwrap();
    const auto& node = plan.roots.at(0).children.at(0);
    REQUIRE(node.id == research.id);
    REQUIRE(node.collapsed);
    REQUIRE(node.summary_text == "1 of 1 tasks completed");
    REQUIRE(node.children.empty());
}

TEST_CASE("Scenario: subtask directly under a project is rejected", "[integration][scenario]") {
    ServiceFixture f;
    auto p = f.add(ItemType::Project, "P");

    auto result = f.service.create_work_item(NewWorkItem{
        .project_id = f.project, .type = ItemType::Subtask, .title = "Too shallow", .parent_id = p.id});
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidHierarchy);
    REQUIRE(hierarchy::violation_of(result.unwrap_err()) == hierarchy::Violation::BadNesting);
}

TEST_CASE("Scenario: search returns the ancestor breadcrumb", "[integration][scenario]") {
    ServiceFixture f;
    auto p = f.add(ItemType::Project, "P");
    auto research = f.add(ItemType::Phase, "Research", p.id);
    f.add(ItemType::Task, "Draft", research.id);

    auto hits = f.service.search_items("Draft", f.project).unwrap();
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].breadcrumb == std::vector<std::string>{"P", "Research"});
}

TEST_CASE("Scenario: projects are isolated from each other", "[integration][scenario]") {
    ServiceFixture f;
    auto p = f.add(ItemType::Project, "P");
    auto other = f.service.identify("/srv/other").unwrap().project_id;

    auto cross = f.service.create_work_item(NewWorkItem{
        .project_id = other, .type = ItemType::Task, .title = "Sneaky", .parent_id = p.id});
    REQUIRE(hierarchy::violation_of(cross.unwrap_err()) == hierarchy::Violation::CrossProject);

    REQUIRE(f.service.complete_item(p.id, other).unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(f.service.get_item_history(p.id, other).unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(f.service.get_current_work_plan(other).unwrap().total_items == 0);
    REQUIRE(f.service.search_items("P", other).unwrap().empty());
}

TEST_CASE("Scenario: history records every accepted mutation", "[integration][scenario]") {
    ServiceFixture f;
    auto p = f.add(ItemType::Project, "P");
    auto task = f.add(ItemType::Task, "Ship", p.id);

    REQUIRE(f.service.update_work_item(task.id, f.project, {
        fields::Title{"Ship it"},
        fields::Status{ItemStatus::InProgress},
        fields::Notes{"tomorrow"},
    }).is_ok());
    REQUIRE(f.service.complete_item(task.id, f.project).is_ok());

    // A rejected mutation leaves no trace.
    REQUIRE(f.service.update_work_item(task.id, f.project, {fields::Status{ItemStatus::NotStarted}}).is_err());

    auto history = f.service.get_item_history(task.id, f.project).unwrap();
    REQUIRE(history.size() == 5);
    REQUIRE(history[0].action == ChangeAction::Create);
    REQUIRE(history[1].action == ChangeAction::FieldChange);
    REQUIRE(history[2].action == ChangeAction::FieldChange);
    REQUIRE(history[3].action == ChangeAction::FieldChange);
    REQUIRE(history[4].action == ChangeAction::Complete);
    REQUIRE(history[4].details == R"({"title":"Ship it","previous_status":"in_progress"})");

    auto recent = f.service.get_changelog(f.project, 1).unwrap();
    REQUIRE(recent.size() == 1);
    REQUIRE(recent[0].action == ChangeAction::Complete);
    REQUIRE(f.service.get_changelog(f.project).unwrap().size() == 6);
}

TEST_CASE("Scenario: depth stays within four levels", "[integration][scenario]") {
    ServiceFixture f;
    auto p = f.add(ItemType::Project, "P");
    auto phase = f.add(ItemType::Phase, "Phase", p.id);
    auto task = f.add(ItemType::Task, "Task", phase.id);
    auto sub = f.add(ItemType::Subtask, "Sub", task.id);

    auto deeper = f.service.create_work_item(NewWorkItem{
        .project_id = f.project, .type = ItemType::Subtask, .title = "Deeper", .parent_id = sub.id});
    REQUIRE(deeper.unwrap_err().kind == ErrorKind::InvalidHierarchy);

    auto plan = f.service.get_current_work_plan(f.project).unwrap();
    REQUIRE(plan.total_items == 4);
    REQUIRE(plan.open_items == 4);
}

TEST_CASE("Service validates its inputs", "[integration][scenario]") {
    ServiceFixture f;

    REQUIRE(f.service.identify("").unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(f.service.get_current_work_plan("").unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(f.service.search_items("  ", f.project).unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(f.service.get_changelog("").unwrap_err().kind == ErrorKind::InvalidArgument);
}
