#include <catch2/catch_test_macros.hpp>
#include "core/project_id.hpp"

using namespace rollplan;

TEST_CASE("identify encodes the descriptor as padded base64", "[project_id]") {
    auto identity = identify("https://github.com/example/repo.git");
    REQUIRE(identity.is_ok());
    REQUIRE(identity.unwrap().project_id == "aHR0cHM6Ly9naXRodWIuY29tL2V4YW1wbGUvcmVwby5naXQ=");
    REQUIRE(identity.unwrap().raw_value == "https://github.com/example/repo.git");
}

TEST_CASE("identify pads short inputs", "[project_id]") {
    REQUIRE(identify("a").unwrap().project_id == "YQ==");
    REQUIRE(identify("ab").unwrap().project_id == "YWI=");
    REQUIRE(identify("abc").unwrap().project_id == "YWJj");
}

TEST_CASE("identify is deterministic", "[project_id]") {
    auto first = identify("/home/dev/project");
    auto second = identify("/home/dev/project");
    REQUIRE(first.unwrap() == second.unwrap());
}

TEST_CASE("identify distinguishes descriptors", "[project_id]") {
    REQUIRE(identify("/home/dev/a").unwrap().project_id !=
            identify("/home/dev/b").unwrap().project_id);
}

TEST_CASE("identify rejects an empty descriptor", "[project_id]") {
    auto result = identify("");
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("identify keeps non-ASCII bytes", "[project_id]") {
    const std::string descriptor = "/home/d\xc3\xa9v/\xe6\x97\xa5\xe6\x9c\xac";
    auto identity = identify(descriptor).unwrap();
    REQUIRE(descriptor_of(identity.project_id).unwrap() == descriptor);
}

TEST_CASE("descriptor_of reverses identify", "[project_id]") {
    auto identity = identify("git@example.com:team/tool.git").unwrap();
    auto decoded = descriptor_of(identity.project_id);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == "git@example.com:team/tool.git");
}

TEST_CASE("descriptor_of rejects malformed identifiers", "[project_id]") {
    REQUIRE(descriptor_of("").unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(descriptor_of("not base64!").is_err());
    REQUIRE(descriptor_of("YQ=").is_err());
}
