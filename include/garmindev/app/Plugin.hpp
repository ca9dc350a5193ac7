#pragma once

#include <garmindev/app/DevConfig.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace GD::App {

struct PluginContext {
    DevConfig const& config;
    std::istream&    in;
    std::ostream&    out;
    std::ostream&    err;
};

class Plugin {
public:
    virtual ~Plugin() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
    [[nodiscard]] virtual auto description() const -> std::string_view = 0;
    [[nodiscard]] virtual auto available() const -> bool { return true; }

    // Returns the process exit code.
    virtual auto run(std::vector<std::string> const& args, PluginContext& context) -> int = 0;
};

class PluginRegistry {
public:
    PluginRegistry() = default;

    PluginRegistry(PluginRegistry const&)            = delete;
    PluginRegistry& operator=(PluginRegistry const&) = delete;
    PluginRegistry(PluginRegistry&&) noexcept        = default;
    PluginRegistry& operator=(PluginRegistry&&) noexcept = default;

    // False when a plugin with the same name is already registered.
    auto add(std::unique_ptr<Plugin> plugin) -> bool;

    [[nodiscard]] auto find(std::string_view name) const -> Plugin*;
    [[nodiscard]] auto names() const -> std::vector<std::string_view>;
    [[nodiscard]] auto size() const -> std::size_t { return plugins_.size(); }
    [[nodiscard]] auto plugins() const -> std::vector<std::unique_ptr<Plugin>> const& { return plugins_; }

    auto run(std::string_view name, std::vector<std::string> const& args, PluginContext& context) -> int;

    void list(std::ostream& out, bool as_json) const;

private:
    std::vector<std::unique_ptr<Plugin>>           plugins_;
    phmap::flat_hash_map<std::string, std::size_t> lookup_;
};

[[nodiscard]] auto MakeUiCapturePlugin() -> std::unique_ptr<Plugin>;
[[nodiscard]] auto MakeBuildPlugin() -> std::unique_ptr<Plugin>;
[[nodiscard]] auto MakeDeployPlugin() -> std::unique_ptr<Plugin>;
[[nodiscard]] auto MakeDevicePlugin() -> std::unique_ptr<Plugin>;
[[nodiscard]] auto MakeDebugPlugin() -> std::unique_ptr<Plugin>;
[[nodiscard]] auto MakePendingPlugin(std::string name, std::string description) -> std::unique_ptr<Plugin>;

// ui-capture, build, deploy, test, debug, device, project
[[nodiscard]] auto MakeBuiltinRegistry() -> PluginRegistry;

} // namespace GD::App
