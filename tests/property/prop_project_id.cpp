#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/project_id.hpp"

using namespace rollplan;

TEST_CASE("Property: identify is deterministic", "[property][project_id]") {
    rc::check("identify(d) == identify(d)",
        [](const std::string& descriptor) {
            RC_PRE(!descriptor.empty());

            auto first = identify(descriptor);
            auto second = identify(descriptor);
            RC_ASSERT(first.is_ok());
            RC_ASSERT(first.unwrap() == second.unwrap());
        }
    );
}

TEST_CASE("Property: identify is injective", "[property][project_id]") {
    rc::check("distinct descriptors give distinct ids",
        [](const std::string& a, const std::string& b) {
            RC_PRE(!a.empty() && !b.empty());

            const auto id_a = identify(a).unwrap().project_id;
            const auto id_b = identify(b).unwrap().project_id;
            RC_ASSERT((a == b) == (id_a == id_b));
        }
    );
}

TEST_CASE("Property: descriptor_of inverts identify", "[property][project_id]") {
    rc::check("descriptor_of(identify(d)) == d",
        [](const std::string& descriptor) {
            RC_PRE(!descriptor.empty());

            auto identity = identify(descriptor).unwrap();
            RC_ASSERT(identity.raw_value == descriptor);
            RC_ASSERT(descriptor_of(identity.project_id).unwrap() == descriptor);
        }
    );
}
