#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace GD::Test {

// Sets or clears one environment variable and restores it on destruction.
class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        apply(value);
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    EnvGuard(EnvGuard&& other) noexcept { *this = std::move(other); }

    EnvGuard& operator=(EnvGuard&& other) noexcept {
        if (this == &other) {
            return *this;
        }
        restore();
        key          = std::move(other.key);
        original     = std::move(other.original);
        active       = other.active;
        other.active = false;
        return *this;
    }

    ~EnvGuard() {
        restore();
    }

private:
    void apply(const char* value) {
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    void restore() {
        if (!active) {
            return;
        }
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
        active = false;
    }

    std::string                key;
    std::optional<std::string> original;
    bool                       active{true};
};

class EnvBlock {
public:
    EnvBlock(std::initializer_list<std::pair<std::string, const char*>> vars) {
        guards.reserve(vars.size());
        for (auto const& [name, value] : vars) {
            guards.emplace_back(name, value);
        }
    }

private:
    std::vector<EnvGuard> guards;
};

inline auto clearDevEnvironment() -> EnvBlock {
    return EnvBlock{
        {"GARMIN_DEV_DEVICE", nullptr},
        {"GARMIN_DEV_SDK_PATH", nullptr},
        {"GARMIN_DEV_OUTPUT_FORMAT", nullptr},
        {"GARMIN_DEV_VERBOSE", nullptr},
    };
}

// Fresh directory under the system temp dir, removed with everything in it.
class TempDir {
public:
    explicit TempDir(std::string_view prefix = "garmindev_test") {
        auto const stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        for (int attempt = 0;; ++attempt) {
            auto candidate = std::filesystem::temp_directory_path()
                             / (std::string(prefix) + "_" + std::to_string(stamp) + "_" + std::to_string(attempt));
            std::error_code ec;
            if (std::filesystem::create_directories(candidate, ec) && !ec) {
                root = std::move(candidate);
                break;
            }
        }
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    auto path() const -> std::filesystem::path const& { return root; }

    auto write(std::string_view name, std::string_view content) const -> std::filesystem::path {
        auto target = root / name;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return target;
    }

    auto read(std::string_view name) const -> std::string {
        std::ifstream in(root / name, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path root;
};

} // namespace GD::Test
