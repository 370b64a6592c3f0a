#include "core/work_item.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace rollplan {

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::optional<std::string> optional_text(std::string_view value) {
    if (value.empty()) return std::nullopt;
    return std::string(value);
}

} // namespace

std::string_view to_string(ItemType type) noexcept {
    switch (type) {
        case ItemType::Project: return "project";
        case ItemType::Phase: return "phase";
        case ItemType::Task: return "task";
        case ItemType::Subtask: return "subtask";
    }
    return "task";
}

std::string_view to_string(ItemStatus status) noexcept {
    switch (status) {
        case ItemStatus::NotStarted: return "not_started";
        case ItemStatus::InProgress: return "in_progress";
        case ItemStatus::Completed: return "completed";
    }
    return "not_started";
}

std::optional<ItemType> parse_item_type(std::string_view text) {
    if (text == "project") return ItemType::Project;
    if (text == "phase") return ItemType::Phase;
    if (text == "task") return ItemType::Task;
    if (text == "subtask") return ItemType::Subtask;
    return std::nullopt;
}

std::optional<ItemStatus> parse_item_status(std::string_view text) {
    if (text == "not_started") return ItemStatus::NotStarted;
    if (text == "in_progress") return ItemStatus::InProgress;
    if (text == "completed") return ItemStatus::Completed;
    return std::nullopt;
}

std::string_view plural_noun(ItemType type) noexcept {
    switch (type) {
        case ItemType::Project: return "projects";
        case ItemType::Phase: return "phases";
        case ItemType::Task: return "tasks";
        case ItemType::Subtask: return "subtasks";
    }
    return "items";
}

std::string_view field_name(const FieldUpdate& update) noexcept {
    return std::visit(overloaded{
        [](const fields::Title&) -> std::string_view { return "title"; },
        [](const fields::Description&) -> std::string_view { return "description"; },
        [](const fields::Status&) -> std::string_view { return "status"; },
        [](const fields::Notes&) -> std::string_view { return "notes"; },
        [](const fields::Parent&) -> std::string_view { return "parent_id"; },
        [](const fields::OrderIndex&) -> std::string_view { return "order_index"; },
    }, update);
}

Result<FieldUpdate> parse_field_update(std::string_view name, std::string_view value) {
    if (name == "id" || name == "project_id" || name == "type") {
        return Result<FieldUpdate>::err(Error::invalid_argument(
            "Field '" + std::string(name) + "' is immutable"));
    }

    if (name == "title") {
        return Result<FieldUpdate>::ok(fields::Title{std::string(value)});
    }
    if (name == "description") {
        return Result<FieldUpdate>::ok(fields::Description{optional_text(value)});
    }
    if (name == "notes") {
        return Result<FieldUpdate>::ok(fields::Notes{optional_text(value)});
    }
    if (name == "status") {
        auto status = parse_item_status(value);
        if (!status) {
            return Result<FieldUpdate>::err(Error::invalid_argument(
                "Invalid status '" + std::string(value) +
                "'. Must be one of: not_started, in_progress, completed"));
        }
        return Result<FieldUpdate>::ok(fields::Status{*status});
    }
    if (name == "parent_id") {
        if (value.empty()) {
            return Result<FieldUpdate>::ok(fields::Parent{std::nullopt});
        }
        ItemId parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc{} || ptr != value.data() + value.size() || parsed <= 0) {
            return Result<FieldUpdate>::err(Error::invalid_argument(
                "parent_id must be a positive integer, got '" + std::string(value) + "'"));
        }
        return Result<FieldUpdate>::ok(fields::Parent{parsed});
    }
    if (name == "order_index") {
        const std::string text(value);
        char* end = nullptr;
        double parsed = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(parsed)) {
            return Result<FieldUpdate>::err(Error::invalid_argument(
                "order_index must be a finite number, got '" + text + "'"));
        }
        return Result<FieldUpdate>::ok(fields::OrderIndex{parsed});
    }

    return Result<FieldUpdate>::err(Error::invalid_argument(
        "Invalid field '" + std::string(name) +
        "'. Valid fields: title, description, status, notes, parent_id, order_index"));
}

bool is_valid_transition(ItemStatus from, ItemStatus to) noexcept {
    if (from == to) return true;
    switch (from) {
        case ItemStatus::NotStarted:
            return to == ItemStatus::InProgress || to == ItemStatus::Completed;
        case ItemStatus::InProgress:
            return to == ItemStatus::NotStarted || to == ItemStatus::Completed;
        case ItemStatus::Completed:
            return to == ItemStatus::InProgress;
    }
    return false;
}

std::string trimmed(std::string_view text) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(whitespace);
    return std::string(text.substr(first, last - first + 1));
}

WorkItem apply_update(WorkItem item, const FieldUpdate& update) {
    std::visit(overloaded{
        [&](const fields::Title& f) { item.title = f.value; },
        [&](const fields::Description& f) { item.description = f.value; },
        [&](const fields::Status& f) { item.status = f.value; },
        [&](const fields::Notes& f) { item.notes = f.value; },
        [&](const fields::Parent& f) { item.parent_id = f.value; },
        [&](const fields::OrderIndex& f) { item.order_index = f.value; },
    }, update);
    return item;
}

} // namespace rollplan
