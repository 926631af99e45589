#include <catch2/catch_test_macros.hpp>
#include "core/types.hpp"

#include <unordered_set>

using namespace blockstore;

TEST_CASE("Uuid generation", "[types]") {
    auto a = Uuid::generate();
    auto b = Uuid::generate();

    REQUIRE_FALSE(a.is_nil());
    REQUIRE(a != b);
    REQUIRE(Uuid{}.is_nil());
}

TEST_CASE("Uuid string form", "[types]") {
    auto id = Uuid::generate();
    auto text = id.to_string();

    REQUIRE(text.size() == 36);
    REQUIRE(text[8] == '-');
    REQUIRE(text[14] == '4');

    SECTION("hyphenated text parses back") {
        REQUIRE(Uuid::parse(text) == id);
    }

    SECTION("compact and upper case forms are accepted") {
        auto parsed = Uuid::parse("550E8400E29B41D4A716446655440000");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->to_string() == "550e8400-e29b-41d4-a716-446655440000");
    }

    SECTION("garbage is rejected") {
        REQUIRE_FALSE(Uuid::parse("").has_value());
        REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
        REQUIRE_FALSE(Uuid::parse("550e8400-e29b-41d4-a716-44665544000g").has_value());
    }
}

TEST_CASE("Uuid works as a hash key", "[types]") {
    std::unordered_set<Uuid> ids;
    auto id = Uuid::generate();
    ids.insert(id);
    ids.insert(id);
    ids.insert(Uuid::generate());
    REQUIRE(ids.size() == 2);
}

TEST_CASE("Timestamp arithmetic and formatting", "[types]") {
    Timestamp epoch(0);
    REQUIRE(epoch.to_iso_string() == "1970-01-01T00:00:00.000Z");

    auto later = epoch + std::chrono::milliseconds(1500);
    REQUIRE(later.millis() == 1500);
    REQUIRE(later - epoch == std::chrono::milliseconds(1500));
    REQUIRE(epoch < later);
    REQUIRE(Timestamp::now() > later);
}
