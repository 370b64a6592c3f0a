#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <string>
#include <string_view>

namespace rollplan {

/**
 * ProjectIdentity - Result of identify().
 */
struct ProjectIdentity {
    ProjectId project_id;
    std::string raw_value;

    bool operator==(const ProjectIdentity&) const = default;
};

/**
 * Map a project descriptor (git remote URL, absolute path, ...) to its
 * project identifier.
 *
 * The identifier is the padded standard base64 encoding of the
 * descriptor's bytes, so equal descriptors give equal identifiers and
 * distinct descriptors give distinct ones. Fails with InvalidArgument
 * on an empty descriptor.
 */
[[nodiscard]] Result<ProjectIdentity> identify(std::string_view descriptor);

/**
 * Recover the descriptor encoded in a project identifier.
 */
[[nodiscard]] Result<std::string> descriptor_of(std::string_view project_id);

} // namespace rollplan
