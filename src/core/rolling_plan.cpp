#include "core/rolling_plan.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace rollplan {

namespace {

using Children = std::vector<const WorkItem*>;

bool order_less(const WorkItem* a, const WorkItem* b) {
    return sibling_order_less(*a, *b);
}

/**
 * Parent/child index over one project's items. Child lists are sorted
 * once so every traversal sees siblings in plan order.
 */
class PlanBuilder {
public:
    PlanBuilder(const ProjectId& project_id, const std::vector<WorkItem>& items) {
        for (const auto& item : items) {
            if (item.project_id != project_id) continue;
            items_.push_back(&item);
            by_id_.emplace(item.id, &item);
        }
        std::sort(items_.begin(), items_.end(), order_less);

        for (const auto* item : items_) {
            if (item->type == ItemType::Project || !item->parent_id) continue;
            if (by_id_.count(*item->parent_id) != 0) {
                children_[*item->parent_id].push_back(item);
            }
        }
    }

    [[nodiscard]] WorkPlan build(const ProjectId& project_id) {
        WorkPlan plan;
        plan.project_id = project_id;
        plan.total_items = items_.size();
        plan.open_items = static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
            [](const WorkItem* item) { return !item->is_completed(); }));

        for (const auto* item : items_) {
            if (item->type == ItemType::Project && !item->parent_id) {
                plan.roots.push_back(render(*item));
            }
        }

        // Whatever the roots did not reach goes to the unassigned bucket:
        // first the tops of detached subtrees, then anything left over
        // (members of a parent cycle).
        for (const auto* item : items_) {
            if (rendered_.count(item->id) == 0 && is_detached_top(*item)) {
                plan.unassigned.push_back(render(*item));
            }
        }
        for (const auto* item : items_) {
            if (rendered_.count(item->id) == 0) {
                plan.unassigned.push_back(render(*item));
            }
        }

        return plan;
    }

private:
    [[nodiscard]] const Children& children_of(ItemId id) const {
        static const Children none;
        auto it = children_.find(id);
        return it == children_.end() ? none : it->second;
    }

    [[nodiscard]] bool is_detached_top(const WorkItem& item) const {
        if (!item.parent_id) return true;  // non-project without parent
        if (item.type == ItemType::Project) return true;
        return by_id_.count(*item.parent_id) == 0;
    }

    [[nodiscard]] bool has_open_descendant(ItemId id) {
        if (auto it = open_below_.find(id); it != open_below_.end()) {
            return it->second;
        }
        // Provisional answer guards against parent cycles.
        open_below_[id] = false;

        bool open = false;
        for (const auto* child : children_of(id)) {
            if (!child->is_completed() || has_open_descendant(child->id)) {
                open = true;
                break;
            }
        }
        open_below_[id] = open;
        return open;
    }

    void mark_rendered(ItemId id) {
        if (!rendered_.insert(id).second) return;
        for (const auto* child : children_of(id)) {
            mark_rendered(child->id);
        }
    }

    [[nodiscard]] PlanNode render(const WorkItem& item) {
        rendered_.insert(item.id);

        PlanNode node;
        node.id = item.id;
        node.title = item.title;
        node.type = item.type;
        node.status = item.status;

        const auto& children = children_of(item.id);

        if (item.is_completed() && !has_open_descendant(item.id)) {
            node.collapsed = true;
            node.summary_text = completion_text(children);
            for (const auto* child : children) {
                mark_rendered(child->id);
            }
            return node;
        }

        node.item = item;
        const bool any_done = std::any_of(children.begin(), children.end(),
            [](const WorkItem* child) { return child->is_completed(); });
        if (any_done) {
            node.progress_text = completion_text(children);
        }

        for (const auto* child : children) {
            if (rendered_.count(child->id) != 0) continue;
            node.children.push_back(render(*child));
        }
        return node;
    }

    std::vector<const WorkItem*> items_;
    std::unordered_map<ItemId, const WorkItem*> by_id_;
    std::unordered_map<ItemId, Children> children_;
    std::unordered_map<ItemId, bool> open_below_;
    std::unordered_set<ItemId> rendered_;
};

} // namespace

std::string completion_text(const std::vector<const WorkItem*>& children) {
    if (children.empty()) {
        return "completed";
    }

    const auto first_type = children.front()->type;
    const bool uniform = std::all_of(children.begin(), children.end(),
        [&](const WorkItem* child) { return child->type == first_type; });
    const auto noun = uniform ? std::string(plural_noun(first_type)) : std::string("items");

    const auto done = std::count_if(children.begin(), children.end(),
        [](const WorkItem* child) { return child->is_completed(); });

    return std::to_string(done) + " of " + std::to_string(children.size()) + " " +
           noun + " completed";
}

WorkPlan build_rolling_plan(const ProjectId& project_id, const std::vector<WorkItem>& items) {
    PlanBuilder builder(project_id, items);
    return builder.build(project_id);
}

} // namespace rollplan
