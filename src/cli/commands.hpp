#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

#include "core/result.hpp"
#include "core/work_item.hpp"

namespace rollplan::service {
class TaskService;
}

namespace rollplan::cli {

struct IdentifyOptions {
    QString descriptor;
};

struct PlanOptions {
    QString projectId;
};

struct CreateOptions {
    QString projectId;
    QString type;
    QString title;
    std::optional<QString> description;
    QString parentId;  // optional
    std::optional<QString> notes;
};

struct UpdateOptions {
    QString projectId;
    QString itemId;
    QStringList assignments;  // "field=value"
};

struct CompleteOptions {
    QString projectId;
    QString itemId;
};

struct SearchOptions {
    QString projectId;
    QString query;
};

struct LogOptions {
    QString projectId;
    QString itemId;  // optional; whole project when empty
    QString limit;   // optional
};

[[nodiscard]] bool is_known_command(const QString& command);

// identify is the only command that works without a database.
[[nodiscard]] bool needs_database(const QString& command);

[[nodiscard]] Result<ItemId> parse_item_id(const QString& text, const char* what);

// "field=value"; splits at the first '=' and defers to parse_field_update.
[[nodiscard]] Result<FieldUpdate> parse_assignment(const QString& text);

[[nodiscard]] Result<QJsonObject> identify_command(const IdentifyOptions& options);
[[nodiscard]] Result<QJsonObject> plan_command(service::TaskService& service, const PlanOptions& options);
[[nodiscard]] Result<QJsonObject> create_command(service::TaskService& service, const CreateOptions& options);
[[nodiscard]] Result<QJsonObject> update_command(service::TaskService& service, const UpdateOptions& options);
[[nodiscard]] Result<QJsonObject> complete_command(service::TaskService& service, const CompleteOptions& options);
[[nodiscard]] Result<QJsonObject> search_command(service::TaskService& service, const SearchOptions& options);
[[nodiscard]] Result<QJsonObject> log_command(service::TaskService& service, const LogOptions& options);

} // namespace rollplan::cli
