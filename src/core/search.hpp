#pragma once

#include "core/work_item.hpp"
#include "core/result.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace rollplan {

/**
 * SearchHit - A matching item and the titles of its ancestors,
 * root first, ending at the immediate parent.
 */
struct SearchHit {
    WorkItem item;
    std::vector<std::string> breadcrumb;

    bool operator==(const SearchHit&) const = default;
};

/**
 * Lowercase ASCII letters; other bytes pass through unchanged.
 */
[[nodiscard]] std::string to_lower_ascii(std::string_view text);

/**
 * Case-insensitive substring test against title and description.
 * lowered_query must already be lowercase.
 */
[[nodiscard]] bool matches_query(const WorkItem& item, std::string_view lowered_query);

/**
 * Search one project's items.
 *
 * The query is trimmed; an empty query fails with InvalidArgument.
 * Results are ordered by type (project first), then order_index, then id.
 * An item whose ancestor chain breaks still matches, with the part of
 * the breadcrumb that could be resolved.
 */
[[nodiscard]] Result<std::vector<SearchHit>> search_items(const std::vector<WorkItem>& items,
                                                          std::string_view query);

} // namespace rollplan
