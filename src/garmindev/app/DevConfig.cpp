#include <garmindev/app/DevConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>

namespace GD::App {

namespace {

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto home_directory() -> std::optional<std::filesystem::path> {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path{home};
    }
    return std::nullopt;
}

auto string_field(nlohmann::json const& json, char const* key, std::string& target) -> std::optional<Error> {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return Error{Error::Code::MalformedInput, std::string{key} + " must be a string"};
    }
    target = it->get<std::string>();
    return std::nullopt;
}

} // namespace

auto DefaultConfigSearchPaths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / ".garmin-dev.json");
    }
    if (auto home = home_directory()) {
        paths.push_back(*home / ".garmin-dev.json");
    }
    paths.emplace_back("/etc/garmin-dev.json");
    return paths;
}

auto DefaultSdkSearchPaths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;
    if (auto home = home_directory()) {
        paths.push_back(*home / "Library" / "Application Support" / "Garmin" / "ConnectIQ" / "Sdks");
    }
    paths.emplace_back("/opt/garmin-sdk");
    paths.emplace_back("/usr/local/garmin-sdk");
    return paths;
}

auto ApplyDevConfigJson(nlohmann::json const& json, DevConfig& config) -> std::optional<Error> {
    if (!json.is_object()) {
        return Error{Error::Code::MalformedInput, "configuration must be a JSON object"};
    }
    if (auto error = string_field(json, "default_device", config.default_device)) {
        return error;
    }
    if (auto error = string_field(json, "output_format", config.output_format)) {
        return error;
    }
    if (auto it = json.find("sdk_path"); it != json.end()) {
        if (it->is_null()) {
            config.sdk_path.reset();
        } else if (it->is_string()) {
            config.sdk_path = it->get<std::string>();
        } else {
            return Error{Error::Code::MalformedInput, "sdk_path must be a string or null"};
        }
    }
    if (auto it = json.find("verbose"); it != json.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            return Error{Error::Code::MalformedInput, "verbose must be a boolean"};
        }
        config.verbose = it->get<bool>();
    }
    return std::nullopt;
}

auto LoadDevConfigFile(std::filesystem::path const& path, DevConfig base) -> Expected<DevConfig> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open " + path.string()});
    }
    auto json = nlohmann::json::parse(in, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, path.string() + " is not valid JSON"});
    }
    if (auto error = ApplyDevConfigJson(json, base)) {
        error->message = path.string() + ": " + error->message.value_or("");
        return std::unexpected(*error);
    }
    base.source = path;
    gd_log("Loaded configuration from " + path.string(), "DevConfig");
    return base;
}

auto LoadDevConfig(std::optional<std::filesystem::path> const& explicit_path,
                   std::vector<std::filesystem::path> const& search_paths,
                   WarningSink const& warn) -> Expected<DevConfig> {
    if (explicit_path) {
        return LoadDevConfigFile(*explicit_path);
    }
    for (auto const& candidate : search_paths) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec) || ec) {
            continue;
        }
        auto loaded = LoadDevConfigFile(candidate);
        if (loaded) {
            return loaded;
        }
        if (warn) {
            warn("Warning: Failed to load config " + candidate.string() + ": " + describeError(loaded.error()));
        }
    }
    return DevConfig{};
}

bool ApplyDevEnvOverrides(DevConfig& config, WarningSink const& warn) {
    auto report = [&](std::string const& message) {
        if (warn) {
            warn(message);
        }
    };

    if (!apply_env("GARMIN_DEV_DEVICE", [&](std::string_view value) {
            if (value.empty()) {
                report("GARMIN_DEV_DEVICE must not be empty");
                return false;
            }
            config.default_device = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("GARMIN_DEV_SDK_PATH", [&](std::string_view value) {
            if (value.empty()) {
                config.sdk_path.reset();
            } else {
                config.sdk_path = std::string{value};
            }
            return true;
        })) {
        return false;
    }

    if (!apply_env("GARMIN_DEV_OUTPUT_FORMAT", [&](std::string_view value) {
            config.output_format = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("GARMIN_DEV_VERBOSE", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                report("GARMIN_DEV_VERBOSE must be a boolean (1/0, true/false, yes/no, on/off)");
                return false;
            }
            config.verbose = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

auto ValidateDevConfig(DevConfig const& config) -> std::optional<std::string> {
    if (config.default_device.empty()) {
        return std::string{"default_device must not be empty"};
    }
    if (config.output_format != "text" && config.output_format != "json") {
        return std::string{"output_format must be 'text' or 'json'"};
    }
    return std::nullopt;
}

auto FindGarminSdk(std::vector<std::filesystem::path> const& roots) -> std::optional<std::string> {
    for (auto const& root : roots) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec) || ec) {
            continue;
        }
        std::vector<std::filesystem::path> sdk_dirs;
        for (auto const& entry : std::filesystem::directory_iterator(root, ec)) {
            std::error_code type_ec;
            if (entry.is_directory(type_ec) && !type_ec) {
                sdk_dirs.push_back(entry.path());
            }
        }
        if (ec || sdk_dirs.empty()) {
            continue;
        }
        std::sort(sdk_dirs.begin(), sdk_dirs.end());
        return sdk_dirs.back().string();
    }
    return std::nullopt;
}

} // namespace GD::App
