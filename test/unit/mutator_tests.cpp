// Unit tests for in-place mutation
#include <catch2/catch_test_macros.hpp>
#include "fuzz/fuzz.hpp"
#include <string>
#include <variant>
#include <vector>

using namespace shapefuzz;
using namespace shapefuzz::fuzz;

namespace {

struct Five {
    uint32_t a{0};
    uint32_t b{0};
    uint32_t c{0};
    uint32_t d{0};
    uint32_t e{0};
};

struct Settings {
    uint8_t level{0};
    uint16_t frozen{0};
    std::vector<uint16_t> items;
    RawBool flag;
};

enum class Mode : uint16_t {
    Off = 0,
    Slow = 10,
    Fast = 20,
    Turbo = 30,
};

struct Ping {
    uint32_t nonce{0};
};

struct Pong {
    uint32_t nonce{0};
    uint64_t time{0};
};

using Message = std::variant<Ping, Pong>;
using MaybePing = std::variant<std::monostate, Ping>;

struct Fixture {
    ShapeRegistry registry;
    int fixup_calls = 0;
    int success_calls = 0;

    Fixture() {
        auto& five = registry.DefineStruct<Five>("Five");
        five.Field("a", &Five::a);
        five.Field("b", &Five::b);
        five.Field("c", &Five::c);
        five.Field("d", &Five::d);
        five.Field("e", &Five::e);
        five.OnFixup([this](Five&, Mutator&) { ++fixup_calls; });
        five.OnSuccess([this](const Five&) { ++success_calls; });

        auto& settings = registry.DefineStruct<Settings>("Settings");
        settings.Field("level", &Settings::level).Min(1).Max(8);
        settings.Field("frozen", &Settings::frozen).Ignore();
        settings.Field("items", &Settings::items).Max(4);
        settings.Field("flag", &Settings::flag);

        registry.DefineEnum<Mode>("Mode")
            .Variant(Mode::Off, "off")
            .Variant(Mode::Slow, "slow")
            .Variant(Mode::Fast, "fast")
            .Variant(Mode::Turbo, "turbo")
            .Ignore();

        registry.DefineStruct<Ping>("Ping").Field("nonce", &Ping::nonce);
        auto& pong = registry.DefineStruct<Pong>("Pong");
        pong.Field("nonce", &Pong::nonce);
        pong.Field("time", &Pong::time);
        registry.DefineVariant<Message>("Message");
        registry.DefineVariant<MaybePing>("MaybePing").Name(0, "none").Name(1, "ping");

        registry.Freeze();
    }
};

MutatorConfig BailConfig(bool fixup) {
    MutatorConfig config;
    config.early_bail_enabled = true;
    config.early_bail_chance = 1.0;
    config.fixup_enabled = fixup;
    return config;
}

} // namespace

TEST_CASE("Mutation - early bail", "[fuzz][mutate]") {
    Fixture fx;
    StdRandomSource rng(21);

    SECTION("Fields after the first are untouched") {
        Mutator mutator(rng, fx.registry, BailConfig(false));
        for (int i = 0; i < 100; ++i) {
            Five value = NewFuzzed<Five>(mutator);
            const Five before = value;
            Mutate(value, mutator);
            REQUIRE(value.b == before.b);
            REQUIRE(value.c == before.c);
            REQUIRE(value.d == before.d);
            REQUIRE(value.e == before.e);
        }
        REQUIRE(fx.fixup_calls == 0);
    }

    SECTION("Fixup still runs for the type when enabled") {
        Mutator mutator(rng, fx.registry, BailConfig(true));
        Five value = NewFuzzed<Five>(mutator);
        const int after_generate = fx.fixup_calls;
        Mutate(value, mutator);
        REQUIRE(fx.fixup_calls == after_generate + 1);
    }

    SECTION("Disabled early bail visits every field") {
        MutatorConfig config;
        config.early_bail_chance = 1.0;
        Mutator mutator(rng, fx.registry, config);
        REQUIRE_FALSE(mutator.ShouldEarlyBailMutation());

        // Each u32 mutation usually changes the field; over many rounds
        // the last field must move at least once
        Five value{};
        bool e_changed = false;
        for (int i = 0; i < 50 && !e_changed; ++i) {
            const uint32_t before = value.e;
            Mutate(value, mutator);
            e_changed = value.e != before;
        }
        REQUIRE(e_changed);
    }
}

TEST_CASE("Mutation - success hooks", "[fuzz][mutate]") {
    Fixture fx;
    StdRandomSource rng(22);

    SECTION("Full pass") {
        Mutator mutator(rng, fx.registry);
        Five value{};
        for (int i = 0; i < 10; ++i) {
            Mutate(value, mutator);
        }
        REQUIRE(fx.success_calls == 10);
    }

    SECTION("Early bail path") {
        Mutator mutator(rng, fx.registry, BailConfig(false));
        Five value{};
        for (int i = 0; i < 10; ++i) {
            Mutate(value, mutator);
        }
        REQUIRE(fx.success_calls == 10);
    }

    SECTION("Generation does not report success") {
        Mutator mutator(rng, fx.registry);
        NewFuzzed<Five>(mutator);
        REQUIRE(fx.success_calls == 0);
    }
}

TEST_CASE("Mutation - field annotations", "[fuzz][mutate]") {
    Fixture fx;
    StdRandomSource rng(23);
    Mutator mutator(rng, fx.registry);

    Settings value = NewFuzzed<Settings>(mutator);
    value.frozen = 0x1234;

    for (int i = 0; i < 500; ++i) {
        Mutate(value, mutator);
        REQUIRE(value.level >= 1);
        REQUIRE(value.level < 8);
        REQUIRE(value.items.size() < 4);
        REQUIRE(value.frozen == 0x1234);
    }
}

TEST_CASE("Mutation - RawBool", "[fuzz][mutate]") {
    Fixture fx;
    StdRandomSource rng(24);

    SECTION("Non-canonical bytes when forced") {
        MutatorConfig config;
        config.non_canonical_bool_chance = 1.0;
        Mutator mutator(rng, fx.registry, config);
        RawBool flag(true);
        for (int i = 0; i < 100; ++i) {
            Mutate(flag, mutator);
            REQUIRE(flag.raw() >= 2);
            REQUIRE_FALSE(flag.is_canonical());
        }
    }

    SECTION("Plain flips otherwise") {
        MutatorConfig config;
        config.non_canonical_bool_chance = 0.0;
        Mutator mutator(rng, fx.registry, config);
        RawBool flag(false);
        Mutate(flag, mutator);
        REQUIRE(flag == RawBool(true));
        Mutate(flag, mutator);
        REQUIRE(flag == RawBool(false));
    }

    SECTION("Generation is always canonical") {
        MutatorConfig config;
        config.non_canonical_bool_chance = 1.0;
        Mutator mutator(rng, fx.registry, config);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(NewFuzzed<RawBool>(mutator).is_canonical());
        }
    }
}

TEST_CASE("Mutation - unit enums", "[fuzz][mutate]") {
    Fixture fx;
    StdRandomSource rng(25);
    Mutator mutator(rng, fx.registry);

    Mode mode = Mode::Off;
    bool saw_other = false;
    for (int i = 0; i < 200; ++i) {
        Mutate(mode, mutator);
        REQUIRE(mode != Mode::Turbo);
        REQUIRE(fx.registry.GetEnum<Mode>().IsDeclared(mode));
        saw_other |= mode != Mode::Off;
    }
    REQUIRE(saw_other);
    REQUIRE(SerializedSize(mode, fx.registry) == 2);
}

TEST_CASE("Mutation - payload variants", "[fuzz][mutate]") {
    Fixture fx;
    StdRandomSource rng(26);
    Mutator mutator(rng, fx.registry);

    SECTION("Active alternative is kept") {
        for (int i = 0; i < 50; ++i) {
            Message msg = NewFuzzed<Message>(mutator);
            const size_t index = msg.index();
            for (int k = 0; k < 20; ++k) {
                Mutate(msg, mutator);
                REQUIRE(msg.index() == index);
            }
        }
    }

    SECTION("Variants with a unit alternative are regenerated") {
        MaybePing value;
        bool saw_none = false;
        bool saw_ping = false;
        for (int i = 0; i < 200; ++i) {
            Mutate(value, mutator);
            saw_none |= value.index() == 0;
            saw_ping |= value.index() == 1;
        }
        REQUIRE(saw_none);
        REQUIRE(saw_ping);
        REQUIRE(SerializedSize(MaybePing{}, fx.registry) == 0);
        REQUIRE(MinNonzeroElementsSize<MaybePing>(fx.registry) == 4);
    }
}
