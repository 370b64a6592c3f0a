#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/item_store.hpp"
#include "core/hierarchy.hpp"
#include "core/rolling_plan.hpp"

#include <functional>
#include <map>

using namespace rollplan;
using namespace rollplan::storage;

namespace {

/**
 * One step of a random editing session. parent_pick selects among the
 * items created so far (or none); project_pick chooses between two
 * projects so cross-project parenting gets exercised.
 */
struct Step {
    int type;
    int parent_pick;
    int project_pick;
    bool complete;
};

const ProjectId PROJECTS[] = {"alpha", "beta"};

int depth_of(const WorkItem& item, const std::map<ItemId, WorkItem>& by_id) {
    int depth = 1;
    auto parent = item.parent_id;
    while (parent && depth <= hierarchy::MAX_DEPTH + 1) {
        parent = by_id.at(*parent).parent_id;
        ++depth;
    }
    return depth;
}

/**
 * Replays steps against a fresh store; rejected creates are expected
 * and simply skipped.
 */
std::vector<WorkItem> replay(const std::vector<Step>& steps, ItemStore& store) {
    std::vector<WorkItem> created;
    for (const auto& step : steps) {
        std::optional<ItemId> parent;
        if (!created.empty() && step.parent_pick >= 0) {
            parent = created[static_cast<size_t>(step.parent_pick) % created.size()].id;
        }

        auto result = store.create(NewWorkItem{
            .project_id = PROJECTS[step.project_pick % 2],
            .type = static_cast<ItemType>(step.type % 4),
            .title = "item",
            .parent_id = parent,
        });
        if (result.is_err()) {
            RC_ASSERT(result.unwrap_err().kind == ErrorKind::InvalidHierarchy);
            continue;
        }

        auto item = std::move(result).unwrap();
        if (step.complete) {
            item = store.complete(item.id, item.project_id).unwrap();
        }
        created.push_back(std::move(item));
    }
    return created;
}

rc::Gen<Step> gen_step() {
    return rc::gen::build<Step>(
        rc::gen::set(&Step::type, rc::gen::inRange(0, 4)),
        rc::gen::set(&Step::parent_pick, rc::gen::inRange(-1, 50)),
        rc::gen::set(&Step::project_pick, rc::gen::inRange(0, 2)),
        rc::gen::set(&Step::complete, rc::gen::arbitrary<bool>()));
}

} // namespace

TEST_CASE("Property: stored items always form a valid hierarchy", "[property][hierarchy]") {
    rc::check("every accepted create respects nesting, scope and depth",
        [] {
            const auto steps = *rc::gen::container<std::vector<Step>>(gen_step());

            auto db = Database::open_memory().unwrap();
            RC_ASSERT(initialize_database(db).is_ok());
            ItemStore store(db);
            const auto created = replay(steps, store);

            std::map<ItemId, WorkItem> by_id;
            for (const auto& item : created) {
                by_id.emplace(item.id, item);
            }

            for (const auto& item : created) {
                if (!item.parent_id) {
                    RC_ASSERT(item.type == ItemType::Project);
                    continue;
                }
                const auto& parent = by_id.at(*item.parent_id);
                RC_ASSERT(parent.project_id == item.project_id);
                RC_ASSERT(hierarchy::can_contain(parent.type, item.type));
                RC_ASSERT(depth_of(item, by_id) <= hierarchy::MAX_DEPTH);
            }
        }
    );
}

TEST_CASE("Property: rolling plan hides only finished work", "[property][rolling_plan]") {
    rc::check("collapsed nodes are completed with no open descendants",
        [] {
            const auto steps = *rc::gen::container<std::vector<Step>>(gen_step());

            auto db = Database::open_memory().unwrap();
            RC_ASSERT(initialize_database(db).is_ok());
            ItemStore store(db);
            const auto created = replay(steps, store);

            std::map<ItemId, std::vector<const WorkItem*>> children;
            for (const auto& item : created) {
                if (item.parent_id) children[*item.parent_id].push_back(&item);
            }

            std::function<bool(ItemId)> has_open_below = [&](ItemId id) {
                for (const auto* child : children[id]) {
                    if (!child->is_completed() || has_open_below(child->id)) return true;
                }
                return false;
            };

            const auto plan = build_rolling_plan("alpha", store.list_by_project("alpha").unwrap());

            std::function<void(const PlanNode&)> check_node = [&](const PlanNode& node) {
                const bool open_below = has_open_below(node.id);
                if (node.collapsed) {
                    RC_ASSERT(node.status == ItemStatus::Completed);
                    RC_ASSERT(!open_below);
                    RC_ASSERT(node.children.empty());
                    RC_ASSERT(node.summary_text == completion_text(children[node.id]));
                } else {
                    RC_ASSERT(node.status != ItemStatus::Completed || open_below);
                    RC_ASSERT(node.children.size() == children[node.id].size());
                    for (const auto& child : node.children) check_node(child);
                }
            };
            for (const auto& root : plan.roots) check_node(root);

            RC_ASSERT(plan.unassigned.empty());
        }
    );
}
