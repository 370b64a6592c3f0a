#include "core/project_id.hpp"

#include <sodium.h>
#include <vector>

namespace rollplan {

namespace {

constexpr int BASE64_VARIANT = sodium_base64_VARIANT_ORIGINAL;

} // namespace

Result<ProjectIdentity> identify(std::string_view descriptor) {
    if (descriptor.empty()) {
        return Result<ProjectIdentity>::err(
            Error::invalid_argument("project descriptor must be a non-empty string"));
    }

    const size_t encoded_len = sodium_base64_ENCODED_LEN(descriptor.size(), BASE64_VARIANT);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded.size(),
                      reinterpret_cast<const unsigned char*>(descriptor.data()),
                      descriptor.size(), BASE64_VARIANT);
    // encoded_len counts the terminating NUL.
    encoded.resize(encoded_len - 1);

    return Result<ProjectIdentity>::ok(ProjectIdentity{
        .project_id = std::move(encoded),
        .raw_value = std::string(descriptor)
    });
}

Result<std::string> descriptor_of(std::string_view project_id) {
    if (project_id.empty()) {
        return Result<std::string>::err(
            Error::invalid_argument("project id must be a non-empty string"));
    }

    std::vector<unsigned char> decoded(project_id.size());
    size_t decoded_len = 0;
    const char* end = nullptr;
    int rc = sodium_base642bin(decoded.data(), decoded.size(),
                               project_id.data(), project_id.size(),
                               nullptr, &decoded_len, &end, BASE64_VARIANT);
    if (rc != 0 || end != project_id.data() + project_id.size()) {
        return Result<std::string>::err(Error::invalid_argument(
            "'" + std::string(project_id) + "' is not a valid project id"));
    }

    return Result<std::string>::ok(
        std::string(reinterpret_cast<const char*>(decoded.data()), decoded_len));
}

} // namespace rollplan
