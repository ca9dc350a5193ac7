#include <garmindev/app/Plugin.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <ostream>
#include <utility>

namespace GD::App {

namespace {

class PendingPlugin final : public Plugin {
public:
    PendingPlugin(std::string name, std::string description)
        : name_(std::move(name)), description_(std::move(description)) {}

    auto name() const -> std::string_view override { return name_; }
    auto description() const -> std::string_view override { return description_; }

    auto run(std::vector<std::string> const&, PluginContext& context) -> int override {
        context.out << "Plugin '" << name_ << "' not implemented yet\n";
        return 1;
    }

private:
    std::string name_;
    std::string description_;
};

} // namespace

auto PluginRegistry::add(std::unique_ptr<Plugin> plugin) -> bool {
    if (!plugin) {
        return false;
    }
    std::string key{plugin->name()};
    if (lookup_.find(key) != lookup_.end()) {
        return false;
    }
    plugins_.push_back(std::move(plugin));
    lookup_.emplace(std::move(key), plugins_.size() - 1);
    return true;
}

auto PluginRegistry::find(std::string_view name) const -> Plugin* {
    auto it = lookup_.find(std::string(name));
    if (it == lookup_.end()) {
        return nullptr;
    }
    return plugins_[it->second].get();
}

auto PluginRegistry::names() const -> std::vector<std::string_view> {
    std::vector<std::string_view> out;
    out.reserve(plugins_.size());
    for (auto const& plugin : plugins_) {
        out.push_back(plugin->name());
    }
    return out;
}

auto PluginRegistry::run(std::string_view name, std::vector<std::string> const& args, PluginContext& context) -> int {
    auto* plugin = find(name);
    if (plugin == nullptr) {
        context.out << "Error: Unknown plugin '" << name << "'\n";
        context.out << "Available plugins: ";
        auto all = names();
        for (std::size_t i = 0; i < all.size(); ++i) {
            if (i != 0) {
                context.out << ", ";
            }
            context.out << all[i];
        }
        context.out << '\n';
        return 1;
    }
    gd_log("Running plugin " + std::string(name) + " with " + std::to_string(args.size()) + " arguments", "PluginRegistry");
    return plugin->run(args, context);
}

void PluginRegistry::list(std::ostream& out, bool as_json) const {
    if (as_json) {
        auto json = nlohmann::ordered_json::array();
        for (auto const& plugin : plugins_) {
            json.push_back({{"name", std::string(plugin->name())},
                            {"description", std::string(plugin->description())},
                            {"type", "builtin"},
                            {"available", plugin->available()}});
        }
        out << json.dump(2) << '\n';
        return;
    }
    out << "Available plugins:\n";
    for (auto const& plugin : plugins_) {
        out << "  " << (plugin->available() ? "✓" : "✗") << ' ' << std::left << std::setw(12)
            << plugin->name() << " - " << plugin->description() << '\n';
    }
}

auto MakePendingPlugin(std::string name, std::string description) -> std::unique_ptr<Plugin> {
    return std::make_unique<PendingPlugin>(std::move(name), std::move(description));
}

auto MakeBuiltinRegistry() -> PluginRegistry {
    PluginRegistry registry;
    registry.add(MakeUiCapturePlugin());
    registry.add(MakeBuildPlugin());
    registry.add(MakeDeployPlugin());
    registry.add(MakePendingPlugin("test", "Testing framework and validation"));
    registry.add(MakeDebugPlugin());
    registry.add(MakeDevicePlugin());
    registry.add(MakePendingPlugin("project", "Project scaffolding and management"));
    return registry;
}

} // namespace GD::App
