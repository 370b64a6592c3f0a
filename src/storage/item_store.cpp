#include "storage/item_store.hpp"
#include "storage/changelog_details.hpp"
#include "core/hierarchy.hpp"

#include <cmath>
#include <set>
#include <string>

namespace rollplan::storage {

namespace {

constexpr double ORDER_STEP = 10.0;
constexpr double FIRST_ORDER = 1.0;

Error item_not_found(ItemId id, const ProjectId& project_id) {
    return Error::not_found("Work item " + std::to_string(id) +
                            " not found in project " + project_id);
}

} // namespace

Result<void, Error> check_field_updates(const std::vector<FieldUpdate>& updates) {
    if (updates.empty()) {
        return Result<void, Error>::err(Error::invalid_argument("No fields to update"));
    }

    std::set<std::string_view> seen;
    for (const auto& update : updates) {
        const auto name = field_name(update);
        if (!seen.insert(name).second) {
            return Result<void, Error>::err(Error::invalid_argument(
                "Field " + std::string(name) + " given more than once"));
        }

        if (const auto* title = std::get_if<fields::Title>(&update)) {
            if (trimmed(title->value).empty()) {
                return Result<void, Error>::err(Error::invalid_argument("Title must not be empty"));
            }
        }
        if (const auto* order = std::get_if<fields::OrderIndex>(&update)) {
            if (!std::isfinite(order->value)) {
                return Result<void, Error>::err(Error::invalid_argument(
                    "order_index must be a finite number"));
            }
        }
    }
    return Result<void, Error>::ok();
}

ItemStore::ItemStore(Database& db) : db_(db), items_(db), log_(db) {}

Result<WorkItem, Error> ItemStore::create(const NewWorkItem& fields) {
    if (fields.project_id.empty()) {
        return Result<WorkItem, Error>::err(Error::invalid_argument("project_id is required"));
    }
    if (trimmed(fields.title).empty()) {
        return Result<WorkItem, Error>::err(Error::invalid_argument("Title must not be empty"));
    }

    return db_.transaction([&] { return create_in_transaction(fields); });
}

Result<WorkItem, Error> ItemStore::create_in_transaction(const NewWorkItem& fields) {
    if (fields.parent_id) {
        auto parent_result = items_.get(*fields.parent_id);
        if (parent_result.is_err()) {
            return Result<WorkItem, Error>::err(parent_result.unwrap_err());
        }
        if (!parent_result.unwrap()) {
            return Result<WorkItem, Error>::err(Error::not_found(
                "Parent item " + std::to_string(*fields.parent_id) + " not found"));
        }
    }

    const auto now = Timestamp::now();
    WorkItem item{
        .id = 0,
        .project_id = fields.project_id,
        .type = fields.type,
        .title = trimmed(fields.title),
        .description = fields.description,
        .status = ItemStatus::NotStarted,
        .parent_id = fields.parent_id,
        .notes = fields.notes,
        .order_index = FIRST_ORDER,
        .created_at = now,
        .updated_at = now
    };

    auto placement = hierarchy::validate_placement(item, [this](ItemId id) { return items_.get(id); });
    if (placement.is_err()) {
        return Result<WorkItem, Error>::err(placement.unwrap_err());
    }

    auto max_result = items_.max_sibling_order(item.project_id, item.parent_id);
    if (max_result.is_err()) {
        return Result<WorkItem, Error>::err(max_result.unwrap_err());
    }
    if (const auto& max_order = max_result.unwrap()) {
        item.order_index = *max_order + ORDER_STEP;
    }

    auto id_result = items_.insert(item);
    if (id_result.is_err()) {
        return Result<WorkItem, Error>::err(id_result.unwrap_err());
    }
    item.id = id_result.unwrap();

    auto logged = log_.append(ChangelogEntry{
        .work_item_id = item.id,
        .project_id = item.project_id,
        .action = ChangeAction::Create,
        .details = create_details(item),
        .created_at = now
    });
    if (logged.is_err()) {
        return Result<WorkItem, Error>::err(logged.unwrap_err());
    }

    return Result<WorkItem, Error>::ok(std::move(item));
}

Result<WorkItem, Error> ItemStore::update(ItemId id,
                                          const ProjectId& project_id,
                                          const std::vector<FieldUpdate>& updates) {
    auto checked = check_field_updates(updates);
    if (checked.is_err()) {
        return Result<WorkItem, Error>::err(checked.unwrap_err());
    }

    return db_.transaction([&] { return update_in_transaction(id, project_id, updates); });
}

Result<WorkItem, Error> ItemStore::update_in_transaction(ItemId id,
                                                         const ProjectId& project_id,
                                                         const std::vector<FieldUpdate>& updates) {
    auto existing_result = items_.get_in_project(id, project_id);
    if (existing_result.is_err()) {
        return Result<WorkItem, Error>::err(existing_result.unwrap_err());
    }
    if (!existing_result.unwrap()) {
        return Result<WorkItem, Error>::err(item_not_found(id, project_id));
    }
    const WorkItem existing = std::move(*existing_result.unwrap());

    struct Change {
        std::string_view field;
        std::string old_json;
        std::string new_json;
    };
    std::vector<Change> changes;
    bool parent_changed = false;

    WorkItem updated = existing;
    for (const auto& raw : updates) {
        FieldUpdate update = raw;
        if (auto* title = std::get_if<fields::Title>(&update)) {
            title->value = trimmed(title->value);
        }
        if (const auto* status = std::get_if<fields::Status>(&update)) {
            if (!is_valid_transition(existing.status, status->value)) {
                return Result<WorkItem, Error>::err(Error::invalid_argument(
                    "Invalid status transition from " + std::string(to_string(existing.status)) +
                    " to " + std::string(to_string(status->value))));
            }
        }

        auto old_json = field_value_json(updated, update);
        updated = apply_update(std::move(updated), update);
        auto new_json = field_value_json(updated, update);
        if (old_json == new_json) continue;

        if (std::holds_alternative<fields::Parent>(update)) {
            parent_changed = true;
        }
        changes.push_back(Change{field_name(update), std::move(old_json), std::move(new_json)});
    }

    if (changes.empty()) {
        return Result<WorkItem, Error>::ok(existing);
    }

    if (parent_changed) {
        auto placement = hierarchy::validate_placement(updated,
            [this](ItemId item_id) { return items_.get(item_id); });
        if (placement.is_err()) {
            return Result<WorkItem, Error>::err(placement.unwrap_err());
        }
    }

    const auto now = Timestamp::now();
    updated.updated_at = now;

    auto written = items_.update(updated);
    if (written.is_err()) {
        return Result<WorkItem, Error>::err(written.unwrap_err());
    }

    for (const auto& change : changes) {
        auto logged = log_.append(ChangelogEntry{
            .work_item_id = updated.id,
            .project_id = updated.project_id,
            .action = ChangeAction::FieldChange,
            .details = field_change_details(change.field, change.old_json, change.new_json),
            .created_at = now
        });
        if (logged.is_err()) {
            return Result<WorkItem, Error>::err(logged.unwrap_err());
        }
    }

    return Result<WorkItem, Error>::ok(std::move(updated));
}

Result<WorkItem, Error> ItemStore::complete(ItemId id, const ProjectId& project_id) {
    return db_.transaction([&] { return complete_in_transaction(id, project_id); });
}

Result<WorkItem, Error> ItemStore::complete_in_transaction(ItemId id, const ProjectId& project_id) {
    auto existing_result = items_.get_in_project(id, project_id);
    if (existing_result.is_err()) {
        return Result<WorkItem, Error>::err(existing_result.unwrap_err());
    }
    if (!existing_result.unwrap()) {
        return Result<WorkItem, Error>::err(item_not_found(id, project_id));
    }

    const WorkItem existing = std::move(*existing_result.unwrap());
    if (existing.is_completed()) {
        return Result<WorkItem, Error>::ok(existing);
    }

    const auto now = Timestamp::now();
    auto completed = with_status(existing, ItemStatus::Completed, now);

    auto written = items_.update(completed);
    if (written.is_err()) {
        return Result<WorkItem, Error>::err(written.unwrap_err());
    }

    auto logged = log_.append(ChangelogEntry{
        .work_item_id = completed.id,
        .project_id = completed.project_id,
        .action = ChangeAction::Complete,
        .details = complete_details(completed, existing.status),
        .created_at = now
    });
    if (logged.is_err()) {
        return Result<WorkItem, Error>::err(logged.unwrap_err());
    }

    return Result<WorkItem, Error>::ok(std::move(completed));
}

Result<WorkItem, Error> ItemStore::get(ItemId id, const ProjectId& project_id) {
    auto result = items_.get_in_project(id, project_id);
    if (result.is_err()) {
        return Result<WorkItem, Error>::err(result.unwrap_err());
    }
    if (!result.unwrap()) {
        return Result<WorkItem, Error>::err(item_not_found(id, project_id));
    }
    return Result<WorkItem, Error>::ok(std::move(*result.unwrap()));
}

Result<std::vector<WorkItem>, Error> ItemStore::list_by_project(const ProjectId& project_id) {
    return items_.get_by_project(project_id);
}

Result<std::vector<WorkItem>, Error> ItemStore::list_by_project(
    const ProjectId& project_id,
    const std::vector<ItemStatus>& statuses
) {
    return items_.get_by_status(project_id, statuses);
}

Result<std::vector<SearchHit>, Error> ItemStore::search(const ProjectId& project_id,
                                                        std::string_view query) {
    return list_by_project(project_id).and_then([&](std::vector<WorkItem> items) {
        return search_items(items, query);
    });
}

} // namespace rollplan::storage
