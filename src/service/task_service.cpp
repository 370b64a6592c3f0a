#include "service/task_service.hpp"

namespace rollplan::service {

namespace {

Result<void> require_project(const ProjectId& project_id) {
    if (project_id.empty()) {
        return Result<void>::err(Error::invalid_argument("project_id is required"));
    }
    return Result<void>::ok();
}

} // namespace

Result<ProjectIdentity> TaskService::identify(std::string_view descriptor) const {
    return rollplan::identify(descriptor);
}

Result<WorkPlan> TaskService::get_current_work_plan(const ProjectId& project_id) {
    return require_project(project_id)
        .and_then([&] { return store_.list_by_project(project_id); })
        .map([&](std::vector<WorkItem> items) { return build_rolling_plan(project_id, items); });
}

Result<WorkItem> TaskService::create_work_item(const NewWorkItem& fields) {
    return store_.create(fields);
}

Result<WorkItem> TaskService::update_work_item(ItemId id,
                                               const ProjectId& project_id,
                                               const std::vector<FieldUpdate>& updates) {
    return require_project(project_id)
        .and_then([&] { return store_.update(id, project_id, updates); });
}

Result<WorkItem> TaskService::complete_item(ItemId id, const ProjectId& project_id) {
    return require_project(project_id)
        .and_then([&] { return store_.complete(id, project_id); });
}

Result<std::vector<SearchHit>> TaskService::search_items(std::string_view query,
                                                         const ProjectId& project_id) {
    return require_project(project_id)
        .and_then([&] { return store_.search(project_id, query); });
}

Result<std::vector<ChangelogEntry>> TaskService::get_changelog(const ProjectId& project_id,
                                                               std::optional<size_t> limit) {
    return require_project(project_id)
        .and_then([&] { return store_.audit_log().list_for_project(project_id, limit); });
}

Result<std::vector<ChangelogEntry>> TaskService::get_item_history(ItemId id,
                                                                  const ProjectId& project_id) {
    return require_project(project_id)
        .and_then([&] { return store_.get(id, project_id); })
        .and_then([&](WorkItem item) { return store_.audit_log().list_for_item(item.id); });
}

} // namespace rollplan::service
