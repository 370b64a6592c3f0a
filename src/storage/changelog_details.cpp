#include "storage/changelog_details.hpp"

#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>

namespace rollplan::storage {

namespace {

std::string json_string(std::string_view s) {
    return "\"" + escape_json_string(s) + "\"";
}

std::string optional_text_json(const std::optional<std::string>& text) {
    return text ? json_string(*text) : "null";
}

std::string optional_id_json(const std::optional<ItemId>& id) {
    return id ? std::to_string(*id) : "null";
}

std::string number_json(double value) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

} // namespace

std::string escape_json_string(std::string_view s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    oss << buf;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string create_details(const WorkItem& item) {
    return "{\"type\":" + json_string(to_string(item.type)) +
           ",\"title\":" + json_string(item.title) +
           ",\"parent_id\":" + optional_id_json(item.parent_id) +
           ",\"description\":" + optional_text_json(item.description) + "}";
}

std::string field_change_details(std::string_view field,
                                 const std::string& old_json,
                                 const std::string& new_json) {
    return "{\"field\":" + json_string(field) +
           ",\"old\":" + old_json +
           ",\"new\":" + new_json + "}";
}

std::string complete_details(const WorkItem& item, ItemStatus previous_status) {
    return "{\"title\":" + json_string(item.title) +
           ",\"previous_status\":" + json_string(to_string(previous_status)) + "}";
}

std::string field_value_json(const WorkItem& item, const FieldUpdate& update) {
    return std::visit([&item](const auto& field) -> std::string {
        using T = std::decay_t<decltype(field)>;
        if constexpr (std::is_same_v<T, fields::Title>) {
            return json_string(item.title);
        } else if constexpr (std::is_same_v<T, fields::Description>) {
            return optional_text_json(item.description);
        } else if constexpr (std::is_same_v<T, fields::Status>) {
            return json_string(to_string(item.status));
        } else if constexpr (std::is_same_v<T, fields::Notes>) {
            return optional_text_json(item.notes);
        } else if constexpr (std::is_same_v<T, fields::Parent>) {
            return optional_id_json(item.parent_id);
        } else {
            return number_json(item.order_index);
        }
    }, update);
}

} // namespace rollplan::storage
