#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <optional>

namespace rollplan {

enum class ChangeAction {
    Create,
    Update,
    Complete,
    FieldChange
};

[[nodiscard]] constexpr std::string_view to_string(ChangeAction action) noexcept {
    switch (action) {
        case ChangeAction::Create: return "create";
        case ChangeAction::Update: return "update";
        case ChangeAction::Complete: return "complete";
        case ChangeAction::FieldChange: return "field-change";
    }
    return "update";
}

[[nodiscard]] inline std::optional<ChangeAction> parse_change_action(std::string_view text) {
    if (text == "create") return ChangeAction::Create;
    if (text == "update") return ChangeAction::Update;
    if (text == "complete") return ChangeAction::Complete;
    if (text == "field-change") return ChangeAction::FieldChange;
    return std::nullopt;
}

/**
 * ChangelogEntry - Immutable audit record of one accepted mutation.
 *
 * details is a JSON object; its shape depends on the action.
 */
struct ChangelogEntry {
    int64_t id{0};
    ItemId work_item_id{0};
    ProjectId project_id;
    ChangeAction action{ChangeAction::Update};
    std::string details;
    Timestamp created_at;

    bool operator==(const ChangelogEntry&) const = default;
};

} // namespace rollplan
