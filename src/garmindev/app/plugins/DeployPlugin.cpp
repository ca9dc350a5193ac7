#include <garmindev/app/Plugin.hpp>
#include <garmindev/cli/ArgumentParser.hpp>

#include "log/TaggedLogger.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace GD::App {

namespace {

void print_usage(std::ostream& out) {
    out << "usage: garmin-dev deploy [-h] [--device DEVICE] [--simulator] executable\n\n"
        << "positional arguments:\n"
        << "  executable            Executable file to deploy\n\n"
        << "options:\n"
        << "  -h, --help            show this help message and exit\n"
        << "  --device, -d DEVICE   Target device\n"
        << "  --simulator, -s       Deploy to simulator\n";
}

class DeployPlugin final : public Plugin {
public:
    auto name() const -> std::string_view override { return "deploy"; }
    auto description() const -> std::string_view override { return "Device deployment and simulator management"; }

    auto run(std::vector<std::string> const& args, PluginContext& context) -> int override {
        std::string                executable;
        std::optional<std::string> device;
        bool                       simulator = false;
        bool                       show_help = false;

        Cli::ArgumentParser parser;
        parser.set_program_name("garmin-dev deploy");
        parser.set_error_logger([&](std::string const& message) { context.err << message << '\n'; });
        parser.add_flag("--help", {.on_set = [&] { show_help = true; }});
        parser.add_value("--device", {.on_value = [&](std::optional<std::string_view> token) -> Cli::ArgumentParser::ParseError {
                                  if (!token) {
                                      return std::string{"--device requires a value"};
                                  }
                                  device = std::string{*token};
                                  return std::nullopt;
                              }});
        parser.add_flag("--simulator", {.on_set = [&] { simulator = true; }});
        parser.add_positional("executable", {.on_value = [&](std::string_view token) -> Cli::ArgumentParser::ParseError {
                                                 executable.assign(token.begin(), token.end());
                                                 return std::nullopt;
                                             },
                                             .required = true});
        parser.add_alias("-h", "--help");
        parser.add_alias("-d", "--device");
        parser.add_alias("-s", "--simulator");

        auto const parsed = parser.parse(args);
        if (show_help) {
            print_usage(context.out);
            return 0;
        }
        if (!parsed) {
            print_usage(context.err);
            return 2;
        }

        gd_log("Deploy target " + executable + " on " + device.value_or(context.config.default_device), "DeployPlugin");
        context.out << "🚀 Deploy Plugin\n";
        context.out << "Executable: " << executable << '\n';
        context.out << "Target: " << (simulator ? "simulator" : "device") << '\n';
        if (!simulator) {
            context.out << "Device: " << device.value_or(context.config.default_device) << '\n';
        }
        context.out << "✅ Deploy plugin executed (implementation pending)\n";
        return 0;
    }
};

} // namespace

auto MakeDeployPlugin() -> std::unique_ptr<Plugin> {
    return std::make_unique<DeployPlugin>();
}

} // namespace GD::App
