#pragma once

#include <garmindev/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GD::App {

struct DevConfig {
    std::string                           default_device{"fenix7"};
    std::optional<std::string>            sdk_path;
    std::string                           output_format{"text"};
    bool                                  verbose{false};
    // File the settings were read from, if any.
    std::optional<std::filesystem::path>  source;
};

using WarningSink = std::function<void(std::string const&)>;

// ./.garmin-dev.json, ~/.garmin-dev.json, /etc/garmin-dev.json
auto DefaultConfigSearchPaths() -> std::vector<std::filesystem::path>;

auto DefaultSdkSearchPaths() -> std::vector<std::filesystem::path>;

// Overlays the keys present in `json` onto `config`.
auto ApplyDevConfigJson(nlohmann::json const& json, DevConfig& config) -> std::optional<Error>;

auto LoadDevConfigFile(std::filesystem::path const& path, DevConfig base = {}) -> Expected<DevConfig>;

/**
 * Resolves the configuration for one run.
 *
 * An explicit path must load. Without one, the first search path that exists
 * and parses wins; files that fail to parse are reported through `warn` and
 * skipped.
 */
auto LoadDevConfig(std::optional<std::filesystem::path> const& explicit_path,
                   std::vector<std::filesystem::path> const& search_paths,
                   WarningSink const& warn) -> Expected<DevConfig>;

// GARMIN_DEV_DEVICE, GARMIN_DEV_SDK_PATH, GARMIN_DEV_OUTPUT_FORMAT, GARMIN_DEV_VERBOSE
bool ApplyDevEnvOverrides(DevConfig& config, WarningSink const& warn);

auto ValidateDevConfig(DevConfig const& config) -> std::optional<std::string>;

// Newest SDK directory (last in lexical order) under the first candidate
// root that has any.
auto FindGarminSdk(std::vector<std::filesystem::path> const& roots) -> std::optional<std::string>;

} // namespace GD::App
