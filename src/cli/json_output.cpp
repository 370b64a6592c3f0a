#include "cli/json_output.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace rollplan::cli {

namespace {

[[nodiscard]] QString qstr(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

[[nodiscard]] QJsonValue optional_text(const std::optional<std::string>& text) {
    return text ? QJsonValue(qstr(*text)) : QJsonValue(QJsonValue::Null);
}

[[nodiscard]] QJsonValue optional_id(const std::optional<ItemId>& id) {
    return id ? QJsonValue(static_cast<qint64>(*id)) : QJsonValue(QJsonValue::Null);
}

[[nodiscard]] QString iso(const Timestamp& ts) {
    return QString::fromStdString(ts.to_iso_string());
}

} // namespace

QJsonObject to_json(const ProjectIdentity& identity) {
    QJsonObject obj;
    obj.insert(QStringLiteral("project_id"), qstr(identity.project_id));
    obj.insert(QStringLiteral("raw_value"), qstr(identity.raw_value));
    return obj;
}

QJsonObject to_json(const WorkItem& item) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(item.id));
    obj.insert(QStringLiteral("project_id"), qstr(item.project_id));
    obj.insert(QStringLiteral("type"), qstr(to_string(item.type)));
    obj.insert(QStringLiteral("title"), qstr(item.title));
    obj.insert(QStringLiteral("description"), optional_text(item.description));
    obj.insert(QStringLiteral("status"), qstr(to_string(item.status)));
    obj.insert(QStringLiteral("parent_id"), optional_id(item.parent_id));
    obj.insert(QStringLiteral("notes"), optional_text(item.notes));
    obj.insert(QStringLiteral("order_index"), item.order_index);
    obj.insert(QStringLiteral("created_at"), iso(item.created_at));
    obj.insert(QStringLiteral("updated_at"), iso(item.updated_at));
    return obj;
}

QJsonObject to_json(const PlanNode& node) {
    if (node.collapsed || !node.item) {
        QJsonObject obj;
        obj.insert(QStringLiteral("id"), static_cast<qint64>(node.id));
        obj.insert(QStringLiteral("title"), qstr(node.title));
        obj.insert(QStringLiteral("type"), qstr(to_string(node.type)));
        obj.insert(QStringLiteral("status"), qstr(to_string(node.status)));
        obj.insert(QStringLiteral("collapsed"), true);
        obj.insert(QStringLiteral("summary"), qstr(node.summary_text));
        return obj;
    }

    auto obj = to_json(*node.item);
    obj.insert(QStringLiteral("collapsed"), false);
    if (!node.progress_text.empty()) {
        obj.insert(QStringLiteral("progress"), qstr(node.progress_text));
    }

    QJsonArray children;
    for (const auto& child : node.children) {
        children.append(to_json(child));
    }
    obj.insert(QStringLiteral("children"), children);
    return obj;
}

QJsonObject to_json(const WorkPlan& plan) {
    QJsonArray roots;
    for (const auto& node : plan.roots) {
        roots.append(to_json(node));
    }
    QJsonArray unassigned;
    for (const auto& node : plan.unassigned) {
        unassigned.append(to_json(node));
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("project_id"), qstr(plan.project_id));
    obj.insert(QStringLiteral("total_items"), static_cast<qint64>(plan.total_items));
    obj.insert(QStringLiteral("open_items"), static_cast<qint64>(plan.open_items));
    obj.insert(QStringLiteral("roots"), roots);
    obj.insert(QStringLiteral("unassigned"), unassigned);
    return obj;
}

QJsonObject to_json(const SearchHit& hit) {
    QJsonArray breadcrumb;
    for (const auto& title : hit.breadcrumb) {
        breadcrumb.append(qstr(title));
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("item"), to_json(hit.item));
    obj.insert(QStringLiteral("breadcrumb"), breadcrumb);
    return obj;
}

QJsonObject to_json(const ChangelogEntry& entry) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(entry.id));
    obj.insert(QStringLiteral("work_item_id"), static_cast<qint64>(entry.work_item_id));
    obj.insert(QStringLiteral("project_id"), qstr(entry.project_id));
    obj.insert(QStringLiteral("action"), qstr(to_string(entry.action)));

    QJsonParseError parseError{};
    const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(entry.details), &parseError);
    if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
        obj.insert(QStringLiteral("details"), doc.object());
    } else {
        obj.insert(QStringLiteral("details"), qstr(entry.details));
    }

    obj.insert(QStringLiteral("created_at"), iso(entry.created_at));
    return obj;
}

QJsonArray to_json(const std::vector<ChangelogEntry>& entries) {
    QJsonArray out;
    for (const auto& entry : entries) {
        out.append(to_json(entry));
    }
    return out;
}

QJsonObject error_to_json(const Error& error) {
    QJsonObject inner;
    inner.insert(QStringLiteral("kind"), qstr(to_string(error.kind)));
    if (!error.reason.empty()) {
        inner.insert(QStringLiteral("reason"), qstr(error.reason));
    }
    inner.insert(QStringLiteral("message"), qstr(error.message));

    QJsonObject obj;
    obj.insert(QStringLiteral("error"), inner);
    return obj;
}

QString to_text(const QJsonObject& obj) {
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

} // namespace rollplan::cli
