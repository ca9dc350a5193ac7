#include <doctest/doctest.h>

#include <garmindev/app/DevConfig.hpp>
#include <garmindev/app/DeviceCatalog.hpp>
#include "GarminDevTestHelper.hpp"

#include <string>
#include <vector>

using namespace GD::App;
using GD::Test::EnvGuard;
using GD::Test::TempDir;

namespace {
auto collect(std::vector<std::string>& sink) -> WarningSink {
    return [&sink](std::string const& message) { sink.push_back(message); };
}
}

TEST_SUITE("app.dev_config") {

TEST_CASE("defaults when no config file exists") {
    TempDir dir;
    std::vector<std::string> warnings;
    auto config = LoadDevConfig(std::nullopt, {dir.path() / "absent.json"}, collect(warnings));
    REQUIRE(config.has_value());
    CHECK(config->default_device == "fenix7");
    CHECK(config->output_format == "text");
    CHECK_FALSE(config->verbose);
    CHECK_FALSE(config->sdk_path.has_value());
    CHECK_FALSE(config->source.has_value());
    CHECK(warnings.empty());
}

TEST_CASE("keys present in the file overlay the defaults") {
    TempDir dir;
    auto path = dir.write(".garmin-dev.json", R"({"default_device": "venu2", "verbose": true})");
    auto config = LoadDevConfig(std::nullopt, {path}, {});
    REQUIRE(config.has_value());
    CHECK(config->default_device == "venu2");
    CHECK(config->verbose);
    CHECK(config->output_format == "text");
    REQUIRE(config->source.has_value());
    CHECK(*config->source == path);
}

TEST_CASE("a broken candidate warns and the search continues") {
    TempDir dir;
    auto broken = dir.write("first/.garmin-dev.json", "{ not json");
    auto good   = dir.write("second/.garmin-dev.json", R"({"output_format": "json"})");
    std::vector<std::string> warnings;
    auto config = LoadDevConfig(std::nullopt, {broken, good}, collect(warnings));
    REQUIRE(config.has_value());
    CHECK(config->output_format == "json");
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].starts_with("Warning: Failed to load config " + broken.string()));
}

TEST_CASE("first readable candidate wins") {
    TempDir dir;
    auto first  = dir.write("a.json", R"({"default_device": "fr965"})");
    auto second = dir.write("b.json", R"({"default_device": "fr955"})");
    auto config = LoadDevConfig(std::nullopt, {first, second}, {});
    REQUIRE(config.has_value());
    CHECK(config->default_device == "fr965");
}

TEST_CASE("explicit config path must load") {
    TempDir dir;
    auto missing = LoadDevConfig(dir.path() / "nope.json", {}, {});
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == GD::Error::Code::IoFailure);

    auto wrong_type = dir.write("typed.json", R"({"verbose": "yes"})");
    auto typed      = LoadDevConfig(wrong_type, {}, {});
    REQUIRE_FALSE(typed.has_value());
    CHECK(typed.error().code == GD::Error::Code::MalformedInput);
    CHECK(typed.error().message->find("verbose") != std::string::npos);

    auto not_object = dir.write("array.json", "[1, 2]");
    CHECK_FALSE(LoadDevConfig(not_object, {}, {}).has_value());
}

TEST_CASE("sdk_path accepts a string or null") {
    DevConfig config;
    CHECK_FALSE(ApplyDevConfigJson(nlohmann::json{{"sdk_path", "/opt/sdk"}}, config).has_value());
    REQUIRE(config.sdk_path.has_value());
    CHECK(*config.sdk_path == "/opt/sdk");
    CHECK_FALSE(ApplyDevConfigJson(nlohmann::json{{"sdk_path", nullptr}}, config).has_value());
    CHECK_FALSE(config.sdk_path.has_value());
    CHECK(ApplyDevConfigJson(nlohmann::json{{"sdk_path", 4}}, config).has_value());
}

TEST_CASE("environment overrides apply on top of the file") {
    auto env = GD::Test::clearDevEnvironment();
    EnvGuard device("GARMIN_DEV_DEVICE", "epix2");
    EnvGuard format("GARMIN_DEV_OUTPUT_FORMAT", "json");
    EnvGuard verbose("GARMIN_DEV_VERBOSE", "on");
    EnvGuard sdk("GARMIN_DEV_SDK_PATH", "/tmp/sdk");

    DevConfig config;
    std::vector<std::string> warnings;
    CHECK(ApplyDevEnvOverrides(config, collect(warnings)));
    CHECK(config.default_device == "epix2");
    CHECK(config.output_format == "json");
    CHECK(config.verbose);
    REQUIRE(config.sdk_path.has_value());
    CHECK(*config.sdk_path == "/tmp/sdk");
    CHECK(warnings.empty());
}

TEST_CASE("invalid environment values are reported") {
    auto env = GD::Test::clearDevEnvironment();
    EnvGuard verbose("GARMIN_DEV_VERBOSE", "maybe");

    DevConfig config;
    std::vector<std::string> warnings;
    CHECK_FALSE(ApplyDevEnvOverrides(config, collect(warnings)));
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].find("GARMIN_DEV_VERBOSE") != std::string::npos);
}

TEST_CASE("validation checks device and output format") {
    DevConfig config;
    CHECK_FALSE(ValidateDevConfig(config).has_value());
    config.output_format = "xml";
    CHECK(ValidateDevConfig(config).has_value());
    config.output_format = "json";
    config.default_device.clear();
    CHECK(ValidateDevConfig(config).has_value());
}

TEST_CASE("sdk discovery picks the newest directory of the first populated root") {
    TempDir dir;
    auto empty_root = dir.path() / "empty";
    std::filesystem::create_directories(empty_root);
    dir.write("sdks/connectiq-sdk-6.4.2/bin/monkeyc", "");
    dir.write("sdks/connectiq-sdk-7.1.0/bin/monkeyc", "");
    dir.write("sdks/readme.txt", "not a directory");

    auto found = FindGarminSdk({dir.path() / "missing", empty_root, dir.path() / "sdks"});
    REQUIRE(found.has_value());
    CHECK(*found == (dir.path() / "sdks" / "connectiq-sdk-7.1.0").string());

    CHECK_FALSE(FindGarminSdk({dir.path() / "missing"}).has_value());
}

TEST_CASE("device catalog") {
    CHECK(kSupportedDevices.size() == 9);
    CHECK(kSupportedDevices.front() == "fenix7");
    CHECK(kSupportedDevices.back() == "edge1040");
    static_assert(IsSupportedDevice("venu2"));
    CHECK_FALSE(IsSupportedDevice("forerunner"));
}

} // TEST_SUITE
