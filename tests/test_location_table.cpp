#include <catch2/catch.hpp>

#include "core/location_table.hpp"
#include "test_helpers.hpp"
#include "utils/file_io.hpp"

#include <set>

using namespace SimonSays;

TEST_CASE("Clicks near a saved location reuse its name", "[locations]") {
    LocationTable table;
    bool created = false;

    std::string first = table.resolve(100, 100, created);
    CHECK(first == "click_1");
    CHECK(created);

    CHECK(table.resolve(110, 105, created) == "click_1");
    CHECK_FALSE(created);
    CHECK(table.resolve(100, 100, created) == "click_1");
    CHECK_FALSE(created);

    // 20px away is outside the threshold
    CHECK(table.resolve(120, 100, created) == "click_2");
    CHECK(created);
    CHECK(table.size() == 2);
}

TEST_CASE("Nearest match prefers the closest location", "[locations]") {
    LocationTable table;
    table.set("far", Point{100, 100});
    table.set("near", Point{110, 100});

    CHECK(table.findNearest(108, 100) == std::string("near"));
    CHECK(table.findNearest(101, 100) == std::string("far"));
    CHECK_FALSE(table.findNearest(500, 500));

    SECTION("equal distance goes to the lexically smallest name") {
        CHECK(table.findNearest(105, 100) == std::string("far"));
    }
}

TEST_CASE("Generated names skip names already in the table", "[locations]") {
    LocationTable table;
    table.set("click_1", Point{0, 0});
    table.set("click_3", Point{500, 0});

    CHECK(table.registerNew(1000, 1000) == "click_2");
    CHECK(table.registerNew(2000, 2000) == "click_4");
    CHECK(table.registerNew(3000, 3000) == "click_5");

    std::set<std::string> names;
    for (const auto& entry : table.entries()) {
        names.insert(entry.first);
    }
    CHECK(names.size() == table.size());

    SECTION("resetting the counter still skips taken names") {
        table.resetNaming();
        CHECK(table.registerNew(4000, 4000) == "click_6");
    }
}

TEST_CASE("Dirty flag follows mutations and saves", "[locations]") {
    Test::TempDir dir;
    LocationTable table;
    CHECK_FALSE(table.isDirty());

    table.registerNew(1, 2);
    CHECK(table.isDirty());

    table.save(dir.str("locations.json"));
    CHECK_FALSE(table.isDirty());

    LocationTable loaded;
    REQUIRE(loaded.load(dir.str("locations.json")));
    CHECK(loaded.find("click_1") == Point{1, 2});
    CHECK_FALSE(loaded.isDirty());
}

TEST_CASE("Location files use the name to x/y object layout", "[locations]") {
    LocationTable table = LocationTable::parseJson(R"({"submit": {"x": 640, "y": 480}, "search": {"x": -5, "y": 12}})");
    CHECK(table.size() == 2);
    CHECK(table.find("submit") == Point{640, 480});
    CHECK(table.find("search") == Point{-5, 12});

    LocationTable again = LocationTable::parseJson(table.toJson());
    CHECK(again.entries() == table.entries());

    CHECK_THROWS_AS(LocationTable::parseJson("[1, 2]"), std::runtime_error);
    CHECK_THROWS_AS(LocationTable::parseJson("{\"a\": {\"x\": 1}}"), std::runtime_error);
    CHECK_THROWS_AS(LocationTable::parseJson("not json"), std::runtime_error);
}

TEST_CASE("Missing or broken location files leave an empty table", "[locations]") {
    Test::TempDir dir;
    LocationTable table;
    table.set("stale", Point{1, 1});

    CHECK_FALSE(table.load(dir.str("missing.json")));
    CHECK(table.empty());

    writeFileAtomic(dir.str("broken.json"), "{ nope");
    CHECK_FALSE(table.load(dir.str("broken.json")));
    CHECK(table.empty());
}

TEST_CASE("Point literals and move targets", "[locations]") {
    CHECK(parsePointLiteral("(10, 20)") == Point{10, 20});
    CHECK(parsePointLiteral("10,20") == Point{10, 20});
    CHECK(parsePointLiteral(" ( -3 ,  +4 ) ") == Point{-3, 4});
    CHECK_FALSE(parsePointLiteral("(10, 20"));
    CHECK_FALSE(parsePointLiteral("click_1"));
    CHECK_FALSE(parsePointLiteral("1,2,3"));

    LocationTable table;
    table.set("ok", Point{7, 8});
    CHECK(resolveTarget(table, "ok") == Point{7, 8});
    CHECK(resolveTarget(table, "(1,1)") == Point{1, 1});
    CHECK_FALSE(resolveTarget(table, "missing"));
}
