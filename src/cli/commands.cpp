#include "cli/commands.hpp"

#include <QJsonArray>

#include "cli/json_output.hpp"
#include "cli/logging.hpp"
#include "service/task_service.hpp"

namespace rollplan::cli {

namespace {

const QStringList COMMANDS = {
    QStringLiteral("identify"),
    QStringLiteral("plan"),
    QStringLiteral("create"),
    QStringLiteral("update"),
    QStringLiteral("complete"),
    QStringLiteral("search"),
    QStringLiteral("log"),
};

[[nodiscard]] std::string utf8(const QString& s) {
    return s.toStdString();
}

[[nodiscard]] std::optional<std::string> optional_utf8(const std::optional<QString>& s) {
    if (!s) return std::nullopt;
    return s->toStdString();
}

[[nodiscard]] Result<ProjectId> require_project(const QString& projectId) {
    const auto trimmed_id = projectId.trimmed();
    if (trimmed_id.isEmpty()) {
        return Result<ProjectId>::err(Error::invalid_argument("--project is required"));
    }
    return Result<ProjectId>::ok(utf8(trimmed_id));
}

[[nodiscard]] QJsonObject item_envelope(const WorkItem& item) {
    QJsonObject obj;
    obj.insert(QStringLiteral("item"), to_json(item));
    return obj;
}

} // namespace

bool is_known_command(const QString& command) {
    return COMMANDS.contains(command);
}

bool needs_database(const QString& command) {
    return is_known_command(command) && command != QStringLiteral("identify");
}

Result<ItemId> parse_item_id(const QString& text, const char* what) {
    bool ok = false;
    const qint64 value = text.trimmed().toLongLong(&ok);
    if (!ok || value <= 0) {
        return Result<ItemId>::err(Error::invalid_argument(
            std::string(what) + " must be a positive integer, got: " + utf8(text)));
    }
    return Result<ItemId>::ok(static_cast<ItemId>(value));
}

Result<FieldUpdate> parse_assignment(const QString& text) {
    const auto eq = text.indexOf(QLatin1Char('='));
    if (eq <= 0) {
        return Result<FieldUpdate>::err(Error::invalid_argument(
            "Expected field=value, got: " + utf8(text)));
    }
    const auto name = utf8(text.left(eq).trimmed());
    const auto value = utf8(text.mid(eq + 1));
    return parse_field_update(name, value);
}

Result<QJsonObject> identify_command(const IdentifyOptions& options) {
    return identify(utf8(options.descriptor))
        .map([](ProjectIdentity identity) { return to_json(identity); });
}

Result<QJsonObject> plan_command(service::TaskService& service, const PlanOptions& options) {
    return require_project(options.projectId)
        .and_then([&](ProjectId project) { return service.get_current_work_plan(project); })
        .map([](WorkPlan plan) { return to_json(plan); });
}

Result<QJsonObject> create_command(service::TaskService& service, const CreateOptions& options) {
    auto project = require_project(options.projectId);
    if (project.is_err()) {
        return Result<QJsonObject>::err(project.unwrap_err());
    }

    const auto type = parse_item_type(utf8(options.type.trimmed()));
    if (!type) {
        return Result<QJsonObject>::err(Error::invalid_argument(
            "--type must be one of project, phase, task, subtask; got: " + utf8(options.type)));
    }

    NewWorkItem fields{
        .project_id = std::move(project).unwrap(),
        .type = *type,
        .title = utf8(options.title),
        .description = optional_utf8(options.description),
        .parent_id = std::nullopt,
        .notes = optional_utf8(options.notes),
    };

    if (!options.parentId.trimmed().isEmpty()) {
        auto parent = parse_item_id(options.parentId, "--parent");
        if (parent.is_err()) {
            return Result<QJsonObject>::err(parent.unwrap_err());
        }
        fields.parent_id = parent.unwrap();
    }

    auto created = service.create_work_item(fields);
    if (created.is_ok()) {
        qCInfo(lcCli) << "created" << to_string(created.unwrap().type).data()
                      << "item" << created.unwrap().id;
    }
    return std::move(created).map([](WorkItem item) { return item_envelope(item); });
}

Result<QJsonObject> update_command(service::TaskService& service, const UpdateOptions& options) {
    auto project = require_project(options.projectId);
    if (project.is_err()) {
        return Result<QJsonObject>::err(project.unwrap_err());
    }
    auto id = parse_item_id(options.itemId, "--id");
    if (id.is_err()) {
        return Result<QJsonObject>::err(id.unwrap_err());
    }

    std::vector<FieldUpdate> updates;
    updates.reserve(static_cast<size_t>(options.assignments.size()));
    for (const auto& assignment : options.assignments) {
        auto update = parse_assignment(assignment);
        if (update.is_err()) {
            return Result<QJsonObject>::err(update.unwrap_err());
        }
        updates.push_back(std::move(update).unwrap());
    }

    auto updated = service.update_work_item(id.unwrap(), project.unwrap(), updates);
    if (updated.is_ok()) {
        qCInfo(lcCli) << "updated item" << updated.unwrap().id;
    }
    return std::move(updated).map([](WorkItem item) { return item_envelope(item); });
}

Result<QJsonObject> complete_command(service::TaskService& service, const CompleteOptions& options) {
    auto project = require_project(options.projectId);
    if (project.is_err()) {
        return Result<QJsonObject>::err(project.unwrap_err());
    }
    auto id = parse_item_id(options.itemId, "--id");
    if (id.is_err()) {
        return Result<QJsonObject>::err(id.unwrap_err());
    }

    auto completed = service.complete_item(id.unwrap(), project.unwrap());
    if (completed.is_ok()) {
        qCInfo(lcCli) << "completed item" << completed.unwrap().id;
    }
    return std::move(completed).map([](WorkItem item) { return item_envelope(item); });
}

Result<QJsonObject> search_command(service::TaskService& service, const SearchOptions& options) {
    auto project = require_project(options.projectId);
    if (project.is_err()) {
        return Result<QJsonObject>::err(project.unwrap_err());
    }

    return service.search_items(utf8(options.query), project.unwrap())
        .map([&](std::vector<SearchHit> hits) {
            QJsonArray results;
            for (const auto& hit : hits) {
                results.append(to_json(hit));
            }
            QJsonObject obj;
            obj.insert(QStringLiteral("query"), options.query.trimmed());
            obj.insert(QStringLiteral("results"), results);
            return obj;
        });
}

Result<QJsonObject> log_command(service::TaskService& service, const LogOptions& options) {
    auto project = require_project(options.projectId);
    if (project.is_err()) {
        return Result<QJsonObject>::err(project.unwrap_err());
    }

    auto to_envelope = [](std::vector<ChangelogEntry> entries) {
        QJsonObject obj;
        obj.insert(QStringLiteral("entries"), to_json(entries));
        return obj;
    };

    if (!options.itemId.trimmed().isEmpty()) {
        auto id = parse_item_id(options.itemId, "--id");
        if (id.is_err()) {
            return Result<QJsonObject>::err(id.unwrap_err());
        }
        return service.get_item_history(id.unwrap(), project.unwrap()).map(to_envelope);
    }

    std::optional<size_t> limit;
    if (!options.limit.trimmed().isEmpty()) {
        bool ok = false;
        const qint64 value = options.limit.trimmed().toLongLong(&ok);
        if (!ok || value <= 0) {
            return Result<QJsonObject>::err(Error::invalid_argument(
                "--limit must be a positive integer, got: " + utf8(options.limit)));
        }
        limit = static_cast<size_t>(value);
    }

    return service.get_changelog(project.unwrap(), limit).map(to_envelope);
}

} // namespace rollplan::cli
