#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/config.hpp"
#include <string>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

// ---------------------------------------------------------------------------
// Movement tuning
// ---------------------------------------------------------------------------

TEST_CASE("ConfigLoader — empty document keeps every default", "[config]") {
    MovementTuning tuning;
    tuning.locomotion.walk_speed = 99.0f;

    REQUIRE(ConfigLoader::load_tuning_from_string("{}", tuning));

    const MovementTuning defaults;
    CHECK(tuning.locomotion.walk_speed          == defaults.locomotion.walk_speed);
    CHECK(tuning.locomotion.ground_acceleration == defaults.locomotion.ground_acceleration);
    CHECK(tuning.locomotion.dir_change_window_ms == defaults.locomotion.dir_change_window_ms);
    CHECK(tuning.jump.max_jumps                 == defaults.jump.max_jumps);
    CHECK(tuning.jump.coyote_ms                 == defaults.jump.coyote_ms);
}

TEST_CASE("ConfigLoader — partial sections override only named keys", "[config]") {
    MovementTuning tuning;
    REQUIRE(ConfigLoader::load_tuning_from_string(R"({
        "locomotion": { "walk_speed": 7.5, "air_control": 0.5 },
        "jump":       { "max_jumps": 3, "coyote_ms": 90 }
    })", tuning));

    CHECK_THAT(tuning.locomotion.walk_speed,  WithinAbs(7.5f, 1e-6f));
    CHECK_THAT(tuning.locomotion.air_control, WithinAbs(0.5f, 1e-6f));
    CHECK_THAT(tuning.locomotion.run_speed,   WithinAbs(10.0f, 1e-6f));
    CHECK(tuning.jump.max_jumps == 3);
    CHECK_THAT(tuning.jump.coyote_ms,        WithinAbs(90.0f, 1e-6f));
    CHECK_THAT(tuning.jump.buffer_window_ms, WithinAbs(200.0f, 1e-6f));
}

TEST_CASE("ConfigLoader — invalid tuning rejects the whole document", "[config]") {
    MovementTuning tuning;
    tuning.locomotion.walk_speed = 4.0f;
    std::string error;

    SECTION("negative speed") {
        CHECK_FALSE(ConfigLoader::load_tuning_from_string(
            R"({"locomotion": {"walk_speed": -1, "run_speed": 20}})", tuning, &error));
        CHECK_THAT(error, ContainsSubstring("walk_speed"));
    }

    SECTION("max_jumps below one") {
        CHECK_FALSE(ConfigLoader::load_tuning_from_string(
            R"({"locomotion": {"walk_speed": 9}, "jump": {"max_jumps": 0}})", tuning, &error));
        CHECK_THAT(error, ContainsSubstring("max_jumps"));
    }

    SECTION("fractional max_jumps") {
        CHECK_FALSE(ConfigLoader::load_tuning_from_string(
            R"({"jump": {"max_jumps": 1.5}})", tuning, &error));
    }

    SECTION("retention outside [0, 1]") {
        CHECK_FALSE(ConfigLoader::load_tuning_from_string(
            R"({"locomotion": {"momentum_retention": 1.5}})", tuning, &error));
        CHECK_THAT(error, ContainsSubstring("momentum_retention"));
    }

    SECTION("non-numeric value") {
        CHECK_FALSE(ConfigLoader::load_tuning_from_string(
            R"({"locomotion": {"jump_force": "high"}})", tuning, &error));
        CHECK_THAT(error, ContainsSubstring("jump_force"));
    }

    SECTION("malformed JSON") {
        CHECK_FALSE(ConfigLoader::load_tuning_from_string("{bad json", tuning, &error));
        CHECK_FALSE(error.empty());
    }

    CHECK(tuning.locomotion.walk_speed == 4.0f);
}

TEST_CASE("ConfigLoader — missing tuning file reports the path", "[config]") {
    MovementTuning tuning;
    std::string error;

    CHECK_FALSE(ConfigLoader::load_tuning("does/not/exist.json", tuning, &error));
    CHECK_THAT(error, ContainsSubstring("does/not/exist.json"));
}

TEST_CASE("ConfigLoader — error out-parameter is optional", "[config]") {
    MovementTuning tuning;
    CHECK_FALSE(ConfigLoader::load_tuning_from_string("[", tuning));
}

#ifdef STRAFE_SOURCE_DIR
TEST_CASE("ConfigLoader — shipped movement.json matches the built-in defaults", "[config]") {
    MovementTuning tuning;
    std::string error;
    REQUIRE(ConfigLoader::load_tuning(std::string(STRAFE_SOURCE_DIR) + "/resources/config/movement.json",
                                      tuning, &error));

    const MovementTuning defaults;
    CHECK(tuning.locomotion.walk_speed         == defaults.locomotion.walk_speed);
    CHECK(tuning.locomotion.max_speed          == defaults.locomotion.max_speed);
    CHECK(tuning.locomotion.momentum_retention == defaults.locomotion.momentum_retention);
    CHECK(tuning.locomotion.jump_forward_boost == defaults.locomotion.jump_forward_boost);
    CHECK(tuning.jump.cooldown_ms              == defaults.jump.cooldown_ms);
    CHECK(tuning.jump.air_jump_scale           == defaults.jump.air_jump_scale);
}

TEST_CASE("ConfigLoader — shipped settings.json loads", "[config]") {
    HostSettings settings;
    std::string error;
    REQUIRE(ConfigLoader::load_settings(std::string(STRAFE_SOURCE_DIR) + "/resources/config/settings.json",
                                        settings, &error));
    CHECK(settings.physics_hz == 120);
    CHECK_THAT(settings.gravity, WithinAbs(-20.0f, 1e-6f));
}
#endif

// ---------------------------------------------------------------------------
// Host settings
// ---------------------------------------------------------------------------

TEST_CASE("ConfigLoader — settings fields are read", "[config]") {
    HostSettings settings;
    REQUIRE(ConfigLoader::load_settings_from_string(R"({
        "window": { "width": 1920, "height": 1080, "title": "test" },
        "fov": 100, "mouse_sensitivity": 0.003, "physics_hz": 240, "debug": true
    })", settings));

    CHECK(settings.window_width  == 1920);
    CHECK(settings.window_height == 1080);
    CHECK(settings.window_title  == "test");
    CHECK_THAT(settings.fov,               WithinAbs(100.0f, 1e-6f));
    CHECK_THAT(settings.mouse_sensitivity, WithinAbs(0.003f, 1e-7f));
    CHECK(settings.physics_hz == 240);
    CHECK(settings.debug);
    CHECK_THAT(settings.gravity, WithinAbs(-20.0f, 1e-6f));
}

TEST_CASE("ConfigLoader — invalid settings are rejected", "[config]") {
    HostSettings settings;
    std::string error;

    CHECK_FALSE(ConfigLoader::load_settings_from_string(R"({"fov": 200})", settings, &error));
    CHECK_THAT(error, ContainsSubstring("fov"));

    CHECK_FALSE(ConfigLoader::load_settings_from_string(R"({"physics_hz": 0})", settings, &error));
    CHECK_FALSE(ConfigLoader::load_settings_from_string(R"({"window": {"width": -5}})", settings, &error));

    CHECK(settings.fov == 95.0f);
    CHECK(settings.window_width == 1280);
}
