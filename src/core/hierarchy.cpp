#include "core/hierarchy.hpp"

#include <string>

namespace rollplan::hierarchy {

namespace {

Error violation(Violation why, std::string message) {
    return Error::invalid_hierarchy(std::string(to_string(why)), std::move(message));
}

std::string allowed_children_text(ItemType parent) {
    switch (parent) {
        case ItemType::Project: return "phase, task";
        case ItemType::Phase: return "task, subtask";
        case ItemType::Task: return "subtask";
        case ItemType::Subtask: return "none";
    }
    return "none";
}

} // namespace

std::string_view to_string(Violation violation) noexcept {
    switch (violation) {
        case Violation::BadNesting: return "bad-nesting";
        case Violation::CrossProject: return "cross-project";
        case Violation::DepthExceeded: return "depth-exceeded";
        case Violation::MissingParent: return "missing-parent";
    }
    return "bad-nesting";
}

std::optional<Violation> violation_of(const Error& error) {
    if (error.kind != ErrorKind::InvalidHierarchy) return std::nullopt;
    for (auto v : {Violation::BadNesting, Violation::CrossProject,
                   Violation::DepthExceeded, Violation::MissingParent}) {
        if (error.reason == to_string(v)) return v;
    }
    return std::nullopt;
}

bool can_contain(ItemType parent, ItemType child) noexcept {
    switch (parent) {
        case ItemType::Project:
            return child == ItemType::Phase || child == ItemType::Task;
        case ItemType::Phase:
            return child == ItemType::Task || child == ItemType::Subtask;
        case ItemType::Task:
            return child == ItemType::Subtask;
        case ItemType::Subtask:
            return false;
    }
    return false;
}

Result<void> validate_placement(const WorkItem& candidate, const ItemLookup& lookup) {
    auto resolve = [&](ItemId id) -> Result<std::optional<WorkItem>> {
        if (candidate.id != 0 && id == candidate.id) {
            return Result<std::optional<WorkItem>>::ok(candidate);
        }
        return lookup(id);
    };

    const auto type_name = std::string(to_string(candidate.type));

    if (!candidate.parent_id) {
        if (candidate.type != ItemType::Project) {
            return Result<void>::err(violation(Violation::BadNesting,
                type_name + " items cannot be top-level; only projects have no parent"));
        }
        return Result<void>::ok();
    }

    if (candidate.type == ItemType::Project) {
        return Result<void>::err(violation(Violation::BadNesting,
            "project items cannot have a parent"));
    }

    auto parent_result = resolve(*candidate.parent_id);
    if (parent_result.is_err()) {
        return Result<void>::err(parent_result.unwrap_err());
    }
    const auto& parent = parent_result.unwrap();
    if (!parent) {
        return Result<void>::err(violation(Violation::MissingParent,
            "Parent item " + std::to_string(*candidate.parent_id) + " does not exist"));
    }

    // (a) nesting table
    if (!can_contain(parent->type, candidate.type)) {
        return Result<void>::err(violation(Violation::BadNesting,
            type_name + " items cannot be children of " + std::string(to_string(parent->type)) +
            "; " + std::string(to_string(parent->type)) + " may contain: " +
            allowed_children_text(parent->type)));
    }

    // (b) project scope
    if (parent->project_id != candidate.project_id) {
        return Result<void>::err(violation(Violation::CrossProject,
            "Parent item " + std::to_string(parent->id) + " belongs to a different project"));
    }

    // (c) bounded walk to the root
    WorkItem current = candidate;
    int depth = 1;
    while (current.parent_id) {
        if (depth >= MAX_DEPTH) {
            return Result<void>::err(violation(Violation::DepthExceeded,
                "Maximum hierarchy depth (" + std::to_string(MAX_DEPTH) + ") exceeded"));
        }

        const ItemId next_id = *current.parent_id;
        auto next_result = resolve(next_id);
        if (next_result.is_err()) {
            return Result<void>::err(next_result.unwrap_err());
        }
        auto next = std::move(next_result).unwrap();
        if (!next) {
            return Result<void>::err(violation(Violation::MissingParent,
                "Ancestor item " + std::to_string(next_id) + " does not exist"));
        }
        if (next->project_id != candidate.project_id) {
            return Result<void>::err(violation(Violation::CrossProject,
                "Ancestor item " + std::to_string(next_id) + " belongs to a different project"));
        }

        current = std::move(*next);
        ++depth;
    }

    if (current.type != ItemType::Project) {
        return Result<void>::err(violation(Violation::BadNesting,
            "Hierarchy root " + std::to_string(current.id) + " is not a project"));
    }

    return Result<void>::ok();
}

} // namespace rollplan::hierarchy
