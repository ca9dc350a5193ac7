#include <garmindev/app/DeviceCatalog.hpp>
#include <garmindev/app/Plugin.hpp>

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace GD::App {

namespace {

class DevicePlugin final : public Plugin {
public:
    auto name() const -> std::string_view override { return "device"; }
    auto description() const -> std::string_view override { return "Device management and information"; }

    auto run(std::vector<std::string> const& args, PluginContext& context) -> int override {
        if (!args.empty() && args.front() != "list") {
            context.out << "Device command '" << args.front() << "' not implemented\n";
            return 0;
        }
        if (context.config.output_format == "json") {
            auto devices = nlohmann::json::array();
            for (auto const device : kSupportedDevices) {
                devices.push_back(std::string(device));
            }
            context.out << devices.dump(2) << '\n';
            return 0;
        }
        context.out << "📱 Supported Devices:\n";
        for (auto const device : kSupportedDevices) {
            context.out << "  • " << device << '\n';
        }
        return 0;
    }
};

class DebugPlugin final : public Plugin {
public:
    auto name() const -> std::string_view override { return "debug"; }
    auto description() const -> std::string_view override { return "Debugging tools and log analysis"; }

    auto run(std::vector<std::string> const&, PluginContext& context) -> int override {
        context.out << "🐛 Debug Plugin\n";
        context.out << "Available debug commands:\n";
        context.out << "  • analyze-logs - Analyze debug log patterns\n";
        context.out << "  • performance - Performance analysis\n";
        context.out << "  • errors - Error detection and reporting\n";
        return 0;
    }
};

} // namespace

auto MakeDevicePlugin() -> std::unique_ptr<Plugin> {
    return std::make_unique<DevicePlugin>();
}

auto MakeDebugPlugin() -> std::unique_ptr<Plugin> {
    return std::make_unique<DebugPlugin>();
}

} // namespace GD::App
