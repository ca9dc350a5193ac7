#include <garmindev/app/DeviceCatalog.hpp>
#include <garmindev/app/Plugin.hpp>
#include <garmindev/cli/ArgumentParser.hpp>

#include "log/TaggedLogger.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace GD::App {

namespace {

void print_usage(std::ostream& out) {
    out << "usage: garmin-dev build [-h] [--device DEVICE] [--output OUTPUT] [--optimize]\n\n"
        << "options:\n"
        << "  -h, --help            show this help message and exit\n"
        << "  --device, -d DEVICE   Target device\n"
        << "  --output, -o OUTPUT   Output file\n"
        << "  --optimize, -O        Optimize build\n";
}

// Reports the resolved settings; the SDK compiler is not invoked.
class BuildPlugin final : public Plugin {
public:
    auto name() const -> std::string_view override { return "build"; }
    auto description() const -> std::string_view override { return "MonkeyC compilation and optimization"; }

    auto run(std::vector<std::string> const& args, PluginContext& context) -> int override {
        std::optional<std::string> device;
        std::optional<std::string> output;
        bool                       optimize  = false;
        bool                       show_help = false;

        auto store = [](std::optional<std::string>& target, char const* flag) {
            return [&target, flag](std::optional<std::string_view> token) -> Cli::ArgumentParser::ParseError {
                if (!token) {
                    return std::string{flag} + " requires a value";
                }
                target = std::string{*token};
                return std::nullopt;
            };
        };

        Cli::ArgumentParser parser;
        parser.set_program_name("garmin-dev build");
        parser.set_error_logger([&](std::string const& message) { context.err << message << '\n'; });
        parser.add_flag("--help", {.on_set = [&] { show_help = true; }});
        parser.add_value("--device", {.on_value = store(device, "--device")});
        parser.add_value("--output", {.on_value = store(output, "--output")});
        parser.add_flag("--optimize", {.on_set = [&] { optimize = true; }});
        parser.add_alias("-h", "--help");
        parser.add_alias("-d", "--device");
        parser.add_alias("-o", "--output");
        parser.add_alias("-O", "--optimize");

        if (!parser.parse(args)) {
            print_usage(context.err);
            return 2;
        }
        if (show_help) {
            print_usage(context.out);
            return 0;
        }

        auto const target = device.value_or(context.config.default_device);
        if (!IsSupportedDevice(target)) {
            gd_log("Building for device outside the catalog: " + target, "BuildPlugin");
        }

        context.out << "🔨 Build Plugin\n";
        context.out << "Device: " << target << '\n';
        context.out << "Optimize: " << (optimize ? "True" : "False") << '\n';
        if (output) {
            context.out << "Output: " << *output << '\n';
        }
        if (context.config.sdk_path) {
            context.out << "SDK: " << *context.config.sdk_path << '\n';
        }
        context.out << "✅ Build plugin executed (implementation pending)\n";
        return 0;
    }
};

} // namespace

auto MakeBuildPlugin() -> std::unique_ptr<Plugin> {
    return std::make_unique<BuildPlugin>();
}

} // namespace GD::App
