#include <catch2/catch_test_macros.hpp>
#include "core/rolling_plan.hpp"

#include <algorithm>
#include <random>

using namespace rollplan;

namespace {

WorkItem item(ItemId id, ItemType type, std::string title, std::optional<ItemId> parent,
              ItemStatus status = ItemStatus::NotStarted, double order = 0.0) {
    WorkItem w;
    w.id = id;
    w.project_id = "proj";
    w.type = type;
    w.title = std::move(title);
    w.parent_id = parent;
    w.status = status;
    w.order_index = order == 0.0 ? static_cast<double>(id) : order;
    return w;
}

constexpr auto Done = ItemStatus::Completed;
constexpr auto Open = ItemStatus::NotStarted;

} // namespace

TEST_CASE("Open work is expanded with full items", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "P", std::nullopt),
        item(2, ItemType::Phase, "Research", 1),
        item(3, ItemType::Task, "Draft", 2),
    };

    auto plan = build_rolling_plan("proj", items);

    REQUIRE(plan.roots.size() == 1);
    const auto& p = plan.roots[0];
    REQUIRE_FALSE(p.collapsed);
    REQUIRE(p.item.has_value());
    REQUIRE(p.item->title == "P");
    REQUIRE(p.children.size() == 1);

    const auto& research = p.children[0];
    REQUIRE_FALSE(research.collapsed);
    REQUIRE(research.children.size() == 1);
    REQUIRE(research.children[0].title == "Draft");
    REQUIRE_FALSE(research.children[0].collapsed);

    REQUIRE(plan.total_items == 3);
    REQUIRE(plan.open_items == 3);
    REQUIRE(plan.unassigned.empty());
}

TEST_CASE("Completed subtrees collapse into a summary", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "P", std::nullopt),
        item(2, ItemType::Phase, "Research", 1, Done),
        item(3, ItemType::Task, "Draft", 2, Done),
    };

    auto plan = build_rolling_plan("proj", items);
    const auto& research = plan.roots[0].children.at(0);

    REQUIRE(research.collapsed);
    REQUIRE_FALSE(research.item.has_value());
    REQUIRE(research.children.empty());
    REQUIRE(research.summary_text == "1 of 1 tasks completed");
    REQUIRE(research.status == Done);
    REQUIRE(plan.open_items == 1);
}

TEST_CASE("A completed node with open descendants stays expanded", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "P", std::nullopt),
        item(2, ItemType::Phase, "Build", 1, Done),
        item(3, ItemType::Task, "Done task", 2, Done),
        item(4, ItemType::Task, "Open task", 2, Done),
        item(5, ItemType::Subtask, "Straggler", 4, Open),
    };

    auto plan = build_rolling_plan("proj", items);
    const auto& build = plan.roots[0].children.at(0);

    REQUIRE_FALSE(build.collapsed);
    REQUIRE(build.children.size() == 2);
    REQUIRE(build.children[0].collapsed);
    REQUIRE(build.children[0].summary_text == "completed");
    REQUIRE_FALSE(build.children[1].collapsed);
    REQUIRE(build.children[1].children.at(0).title == "Straggler");
    REQUIRE(build.progress_text == "2 of 2 tasks completed");
}

TEST_CASE("Summary text counts children exactly", "[rolling_plan]") {
    SECTION("Uniform children") {
        std::vector<WorkItem> kids = {
            item(2, ItemType::Task, "a", 1, Done),
            item(3, ItemType::Task, "b", 1, Open),
            item(4, ItemType::Task, "c", 1, Done),
        };
        std::vector<const WorkItem*> ptrs;
        for (const auto& k : kids) ptrs.push_back(&k);
        REQUIRE(completion_text(ptrs) == "2 of 3 tasks completed");
    }

    SECTION("Mixed children") {
        std::vector<WorkItem> kids = {
            item(2, ItemType::Phase, "a", 1, Done),
            item(3, ItemType::Task, "b", 1, Done),
        };
        std::vector<const WorkItem*> ptrs;
        for (const auto& k : kids) ptrs.push_back(&k);
        REQUIRE(completion_text(ptrs) == "2 of 2 items completed");
    }

    SECTION("No children") {
        REQUIRE(completion_text({}) == "completed");
    }
}

TEST_CASE("Expanded nodes show progress only when some child is done", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "P", std::nullopt),
        item(2, ItemType::Task, "a", 1, Done),
        item(3, ItemType::Task, "b", 1, Open),
        item(4, ItemType::Phase, "Later", 1, Open),
    };

    auto plan = build_rolling_plan("proj", items);
    REQUIRE(plan.roots[0].progress_text == "1 of 3 items completed");
    REQUIRE(plan.roots[0].children.at(2).progress_text.empty());
}

TEST_CASE("Siblings are ordered by order_index then id", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "P", std::nullopt),
        item(5, ItemType::Task, "third", 1, Open, 30.0),
        item(4, ItemType::Task, "second-b", 1, Open, 20.0),
        item(3, ItemType::Task, "second-a", 1, Open, 20.0),
        item(2, ItemType::Task, "first", 1, Open, 10.0),
    };

    auto plan = build_rolling_plan("proj", items);
    const auto& children = plan.roots[0].children;
    REQUIRE(children.size() == 4);
    REQUIRE(children[0].title == "first");
    REQUIRE(children[1].title == "second-a");
    REQUIRE(children[2].title == "second-b");
    REQUIRE(children[3].title == "third");
}

TEST_CASE("Completed project roots are still listed", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "Shipped", std::nullopt, Done),
        item(2, ItemType::Task, "only", 1, Done),
        item(3, ItemType::Project, "Active", std::nullopt, Open),
    };

    auto plan = build_rolling_plan("proj", items);
    REQUIRE(plan.roots.size() == 2);
    REQUIRE(plan.roots[0].collapsed);
    REQUIRE(plan.roots[0].summary_text == "1 of 1 tasks completed");
    REQUIRE_FALSE(plan.roots[1].collapsed);
    REQUIRE(plan.open_items == 1);
}

TEST_CASE("Unreachable items go to the unassigned bucket", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "P", std::nullopt),
        item(2, ItemType::Task, "Orphan", 99),
        item(3, ItemType::Subtask, "Orphan child", 2),
        item(4, ItemType::Task, "Loose", std::nullopt),
    };

    auto plan = build_rolling_plan("proj", items);

    REQUIRE(plan.roots.size() == 1);
    REQUIRE(plan.roots[0].children.empty());
    REQUIRE(plan.unassigned.size() == 2);
    REQUIRE(plan.unassigned[0].title == "Orphan");
    REQUIRE(plan.unassigned[0].children.at(0).title == "Orphan child");
    REQUIRE(plan.unassigned[1].title == "Loose");
    REQUIRE(plan.total_items == 4);
}

TEST_CASE("Parent cycles do not hang the builder", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "P", std::nullopt),
        item(2, ItemType::Phase, "A", 3),
        item(3, ItemType::Task, "B", 2),
    };

    auto plan = build_rolling_plan("proj", items);
    REQUIRE(plan.roots.size() == 1);
    REQUIRE_FALSE(plan.unassigned.empty());
}

TEST_CASE("Items of other projects are ignored", "[rolling_plan]") {
    auto foreign = item(2, ItemType::Task, "Foreign", 1);
    foreign.project_id = "other";

    std::vector<WorkItem> items = {item(1, ItemType::Project, "P", std::nullopt), foreign};

    auto plan = build_rolling_plan("proj", items);
    REQUIRE(plan.total_items == 1);
    REQUIRE(plan.roots[0].children.empty());
    REQUIRE(plan.unassigned.empty());
}

TEST_CASE("The plan does not depend on input order", "[rolling_plan]") {
    std::vector<WorkItem> items = {
        item(1, ItemType::Project, "P", std::nullopt),
        item(2, ItemType::Phase, "A", 1, Done),
        item(3, ItemType::Task, "A1", 2, Done),
        item(4, ItemType::Phase, "B", 1),
        item(5, ItemType::Task, "B1", 4, Done),
        item(6, ItemType::Task, "B2", 4),
        item(7, ItemType::Subtask, "B2a", 6),
    };

    const auto expected = build_rolling_plan("proj", items);

    std::mt19937 rng(1234);
    for (int i = 0; i < 10; ++i) {
        std::shuffle(items.begin(), items.end(), rng);
        REQUIRE(build_rolling_plan("proj", items) == expected);
    }
}
