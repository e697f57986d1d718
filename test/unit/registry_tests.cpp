// Unit tests for ShapeRegistry declaration and validation
#include <catch2/catch_test_macros.hpp>
#include "fuzz/fuzz.hpp"
#include <stdexcept>
#include <variant>

using namespace shapefuzz::fuzz;

namespace {

struct Point {
    int32_t x{0};
    int32_t y{0};
};

struct Unregistered {
    uint8_t value{0};
};

enum class Level : uint8_t {
    Low = 1,
    High = 2,
};

using Either = std::variant<Point, uint32_t>;

} // namespace

TEST_CASE("ShapeRegistry - lifecycle", "[fuzz][registry]") {
    ShapeRegistry registry;
    auto& point = registry.DefineStruct<Point>("Point");
    point.Field("x", &Point::x);
    point.Field("y", &Point::y);
    registry.DefineEnum<Level>("Level").Variant(Level::Low, "low").Variant(Level::High, "high");

    SECTION("Names, size and membership") {
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.TypeNames() == std::vector<std::string>{"Point", "Level"});
        REQUIRE(registry.Contains<Point>());
        REQUIRE_FALSE(registry.Contains<Unregistered>());
        REQUIRE(point.field_count() == 2);
    }

    SECTION("Lookups before freeze throw") {
        REQUIRE_FALSE(registry.frozen());
        REQUIRE_THROWS_AS(registry.GetStruct<Point>(), std::logic_error);
    }

    SECTION("Frozen registry serves lookups") {
        registry.Freeze();
        REQUIRE(registry.frozen());
        REQUIRE(registry.GetStruct<Point>().frozen());
        REQUIRE(registry.GetStruct<Point>().name() == "Point");
        REQUIRE(registry.GetEnum<Level>().variants().size() == 2);
        REQUIRE(IsFixedSize<Point>(registry));
        REQUIRE(MinNonzeroElementsSize<Point>(registry) == 8);
    }

    SECTION("Unregistered type throws after freeze") {
        registry.Freeze();
        REQUIRE_THROWS_AS(registry.GetStruct<Unregistered>(), std::logic_error);
    }

    SECTION("No definitions after freeze") {
        registry.Freeze();
        REQUIRE_THROWS_AS(registry.DefineStruct<Unregistered>("Unregistered"), std::logic_error);
        REQUIRE_THROWS_AS(point.Field("z", &Point::x), std::logic_error);
    }

    SECTION("Freeze only once") {
        registry.Freeze();
        REQUIRE_THROWS_AS(registry.Freeze(), std::logic_error);
    }

    SECTION("Duplicate type") {
        REQUIRE_THROWS_AS(registry.DefineStruct<Point>("Point2"), std::logic_error);
    }
}

TEST_CASE("ShapeRegistry - declaration errors", "[fuzz][registry]") {
    ShapeRegistry registry;

    SECTION("Field bounds with min >= max") {
        auto& point = registry.DefineStruct<Point>("Point");
        point.Field("x", &Point::x).Min(10).Max(5);
        REQUIRE_THROWS_AS(registry.Freeze(), std::invalid_argument);
        REQUIRE_FALSE(registry.frozen());
    }

    SECTION("Duplicate field name") {
        auto& point = registry.DefineStruct<Point>("Point");
        point.Field("x", &Point::x);
        point.Field("x", &Point::y);
        REQUIRE_THROWS_AS(registry.Freeze(), std::invalid_argument);
    }

    SECTION("Every enum variant ignored") {
        registry.DefineEnum<Level>("Level")
            .Variant(Level::Low, "low")
            .Ignore()
            .Variant(Level::High, "high")
            .Ignore();
        REQUIRE_THROWS_AS(registry.Freeze(), std::invalid_argument);
    }

    SECTION("Zero enum weights") {
        registry.DefineEnum<Level>("Level").Variant(Level::Low, "low").Weight(0);
        REQUIRE_THROWS_AS(registry.Freeze(), std::invalid_argument);
    }

    SECTION("Duplicate enum value") {
        registry.DefineEnum<Level>("Level").Variant(Level::Low, "low").Variant(Level::Low, "again");
        REQUIRE_THROWS_AS(registry.Freeze(), std::invalid_argument);
    }

    SECTION("Weight before any variant") {
        auto& level = registry.DefineEnum<Level>("Level");
        REQUIRE_THROWS_AS(level.Weight(2), std::logic_error);
    }

    SECTION("Variant alternative out of range") {
        auto& either = registry.DefineVariant<Either>("Either");
        REQUIRE_THROWS_AS(either.Name(2, "missing"), std::logic_error);
        REQUIRE_THROWS_AS(either.Weight(5, 1), std::logic_error);
    }

    SECTION("Every variant alternative ignored") {
        registry.DefineVariant<Either>("Either").Ignore(0).Ignore(1);
        REQUIRE_THROWS_AS(registry.Freeze(), std::invalid_argument);
    }
}

TEST_CASE("ShapeRegistry - shared across mutators", "[fuzz][registry]") {
    ShapeRegistry registry;
    auto& point = registry.DefineStruct<Point>("Point");
    point.Field("x", &Point::x).Min(-5).Max(5);
    point.Field("y", &Point::y);
    registry.Freeze();

    StdRandomSource rng_a(1);
    StdRandomSource rng_b(1);
    Mutator a(rng_a, registry);
    Mutator b(rng_b, registry);

    for (int i = 0; i < 50; ++i) {
        Point pa = NewFuzzed<Point>(a);
        Point pb = NewFuzzed<Point>(b);
        REQUIRE(pa.x == pb.x);
        REQUIRE(pa.y == pb.y);
        REQUIRE(pa.x >= -5);
        REQUIRE(pa.x < 5);
    }
}
