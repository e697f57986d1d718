// Unit tests for sequence and text generation / mutation
#include <catch2/catch_test_macros.hpp>
#include "fuzz/fuzz.hpp"
#include <string>
#include <vector>

using namespace shapefuzz;
using namespace shapefuzz::fuzz;

namespace {

struct Cell {
    uint16_t id{0};
    uint8_t state{0};
};

struct Fixture {
    ShapeRegistry registry;

    Fixture() {
        auto& cell = registry.DefineStruct<Cell>("Cell");
        cell.Field("id", &Cell::id);
        cell.Field("state", &Cell::state);
        registry.Freeze();
    }
};

Constraints<size_t> CountAndBudget(size_t lo, size_t hi, size_t budget) {
    auto c = Constraints<size_t>::Range(lo, hi);
    c.max_size = budget;
    return c;
}

} // namespace

TEST_CASE("Sequences - element counts", "[fuzz][sequence]") {
    Fixture fx;
    StdRandomSource rng(41);

    SECTION("Declared count bounds") {
        Mutator mutator(rng, fx.registry);
        auto c = Constraints<size_t>::Range(2, 5);
        for (int i = 0; i < 300; ++i) {
            auto items = NewFuzzed<std::vector<uint8_t>>(mutator, &c);
            REQUIRE(items.size() >= 2);
            REQUIRE(items.size() < 5);
        }
    }

    SECTION("Default cap from config") {
        MutatorConfig config;
        config.max_sequence_elements = 3;
        Mutator mutator(rng, fx.registry, config);
        for (int i = 0; i < 300; ++i) {
            REQUIRE(NewFuzzed<std::vector<uint32_t>>(mutator).size() <= 3);
        }
    }

    SECTION("Weighted toward the minimum") {
        Mutator mutator(rng, fx.registry);
        auto low = Constraints<size_t>::Range(0, 50, Weighted::Min);
        auto high = Constraints<size_t>::Range(0, 50, Weighted::Max);
        size_t low_total = 0;
        size_t high_total = 0;
        for (int i = 0; i < 300; ++i) {
            low_total += NewFuzzed<std::vector<uint8_t>>(mutator, &low).size();
            high_total += NewFuzzed<std::vector<uint8_t>>(mutator, &high).size();
        }
        REQUIRE(low_total < high_total);
    }
}

TEST_CASE("Sequences - byte budget", "[fuzz][sequence]") {
    Fixture fx;
    StdRandomSource rng(42);
    Mutator mutator(rng, fx.registry);

    SECTION("Registered struct elements") {
        REQUIRE(MinNonzeroElementsSize<Cell>(fx.registry) == 3);
        for (int i = 0; i < 200; ++i) {
            auto cells = NewFuzzedWithin<std::vector<Cell>>(mutator, 10);
            REQUIRE(cells.size() <= 3);
            REQUIRE(SerializedSize(cells, fx.registry) <= 10);
        }
    }

    SECTION("Text elements") {
        for (int i = 0; i < 200; ++i) {
            auto words = NewFuzzedWithin<std::vector<std::string>>(mutator, 30);
            REQUIRE(SerializedSize(words, fx.registry) <= 30);
        }
    }

    SECTION("Budget below one element") {
        auto cells = NewFuzzedWithin<std::vector<Cell>>(mutator, 2);
        REQUIRE(cells.empty());
    }
}

TEST_CASE("Sequences - mutation", "[fuzz][sequence]") {
    Fixture fx;
    StdRandomSource rng(43);
    Mutator mutator(rng, fx.registry);

    SECTION("Count bounds hold under mutation") {
        auto c = Constraints<size_t>::Range(1, 6);
        std::vector<uint16_t> items = {1, 2, 3};
        for (int i = 0; i < 500; ++i) {
            Mutate(items, mutator, &c);
            REQUIRE(items.size() >= 1);
            REQUIRE(items.size() < 6);
        }
    }

    SECTION("Budget limits growth") {
        auto c = CountAndBudget(0, 100, 16);
        std::vector<uint32_t> items = {7, 8};
        for (int i = 0; i < 500; ++i) {
            Mutate(items, mutator, &c);
            REQUIRE(SerializedSize(items, fx.registry) <= 16);
        }
    }

    SECTION("Empty sequence at minimum is left alone") {
        auto c = Constraints<size_t>::Range(0, 1);
        std::vector<uint8_t> items;
        Mutate(items, mutator, &c);
        REQUIRE(items.empty());
    }

    SECTION("Mutation eventually changes the sequence") {
        std::vector<uint8_t> items = {1, 2, 3, 4};
        const auto original = items;
        bool changed = false;
        for (int i = 0; i < 20 && !changed; ++i) {
            Mutate(items, mutator);
            changed = items != original;
        }
        REQUIRE(changed);
    }
}

TEST_CASE("Text - mutation", "[fuzz][sequence]") {
    Fixture fx;
    StdRandomSource rng(44);
    Mutator mutator(rng, fx.registry);

    SECTION("Byte budget holds") {
        auto c = CountAndBudget(0, 100, 12);
        std::string text = "abc";
        for (int i = 0; i < 500; ++i) {
            Mutate(text, mutator, &c);
            REQUIRE(text.size() <= 12);
        }
    }

    SECTION("Multi-byte code points are replaced whole") {
        std::string text = "\xE2\x82\xAC\xE2\x82\xAC"; // two euro signs
        auto c = CountAndBudget(2, 3, 6);
        for (int i = 0; i < 200; ++i) {
            Mutate(text, mutator, &c);
            // Count is pinned at two, so only replacement applies
            REQUIRE(text.size() <= 6);
            size_t starts = 0;
            for (char ch : text) {
                starts += (static_cast<uint8_t>(ch) & 0xC0) != 0x80;
            }
            REQUIRE(starts == 2);
        }
    }

    SECTION("ASCII mutation stays 7-bit") {
        AsciiString text("hello");
        for (int i = 0; i < 300; ++i) {
            Mutate(text, mutator);
            for (char ch : text.value) {
                REQUIRE(static_cast<uint8_t>(ch) <= 0x7F);
            }
        }
    }
}
