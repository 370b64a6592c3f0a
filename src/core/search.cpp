#include "core/search.hpp"
#include "core/hierarchy.hpp"

#include <algorithm>
#include <unordered_map>

namespace rollplan {

namespace {

using ItemIndex = std::unordered_map<ItemId, const WorkItem*>;

std::vector<std::string> breadcrumb_for(const WorkItem& item, const ItemIndex& by_id) {
    std::vector<std::string> titles;
    auto parent_id = item.parent_id;

    // Bounded so a corrupt parent cycle cannot loop forever.
    while (parent_id && static_cast<int>(titles.size()) < hierarchy::MAX_DEPTH) {
        auto it = by_id.find(*parent_id);
        if (it == by_id.end()) break;
        titles.push_back(it->second->title);
        parent_id = it->second->parent_id;
    }

    std::reverse(titles.begin(), titles.end());
    return titles;
}

} // namespace

std::string to_lower_ascii(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
    });
    return lower;
}

bool matches_query(const WorkItem& item, std::string_view lowered_query) {
    if (to_lower_ascii(item.title).find(lowered_query) != std::string::npos) {
        return true;
    }
    return item.description &&
           to_lower_ascii(*item.description).find(lowered_query) != std::string::npos;
}

Result<std::vector<SearchHit>> search_items(const std::vector<WorkItem>& items,
                                            std::string_view query) {
    const auto needle = to_lower_ascii(trimmed(query));
    if (needle.empty()) {
        return Result<std::vector<SearchHit>>::err(
            Error::invalid_argument("Search query cannot be empty"));
    }

    ItemIndex by_id;
    for (const auto& item : items) {
        by_id.emplace(item.id, &item);
    }

    std::vector<const WorkItem*> matches;
    for (const auto& item : items) {
        if (matches_query(item, needle)) {
            matches.push_back(&item);
        }
    }

    std::sort(matches.begin(), matches.end(), [](const WorkItem* a, const WorkItem* b) {
        if (a->type != b->type) return type_rank(a->type) < type_rank(b->type);
        return sibling_order_less(*a, *b);
    });

    std::vector<SearchHit> hits;
    hits.reserve(matches.size());
    for (const auto* item : matches) {
        hits.push_back(SearchHit{*item, breadcrumb_for(*item, by_id)});
    }

    return Result<std::vector<SearchHit>>::ok(std::move(hits));
}

} // namespace rollplan
