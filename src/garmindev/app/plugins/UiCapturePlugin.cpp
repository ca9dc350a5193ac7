#include <garmindev/app/FileIo.hpp>
#include <garmindev/app/Plugin.hpp>
#include <garmindev/capture/UiStateBuilder.hpp>
#include <garmindev/capture/UiStateSerialization.hpp>
#include <garmindev/cli/ArgumentParser.hpp>

#include "log/TaggedLogger.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace GD::App {

namespace {

struct UiCaptureOptions {
    std::optional<std::string> input;
    std::string                output{"ui-state.xml"};
    Capture::OutputFormat      format = Capture::OutputFormat::Xml;
    std::optional<std::string> device;
    bool                       show_help = false;
};

void print_usage(std::ostream& out) {
    out << "usage: garmin-dev ui-capture [-h] [--input INPUT] [--output OUTPUT] [--format {xml,json}] [--device DEVICE]\n\n"
        << "options:\n"
        << "  -h, --help            show this help message and exit\n"
        << "  --input, -i INPUT     Input log file (default: stdin)\n"
        << "  --output, -o OUTPUT   Output file (default: ui-state.xml)\n"
        << "  --format, -f {xml,json}\n"
        << "                        Output format\n"
        << "  --device, -d DEVICE   Target device\n";
}

auto text_value(std::optional<std::string>& target, char const* flag) {
    return [&target, flag](std::optional<std::string_view> token) -> Cli::ArgumentParser::ParseError {
        if (!token) {
            return std::string{flag} + " requires a value";
        }
        target = std::string{*token};
        return std::nullopt;
    };
}

class UiCapturePlugin final : public Plugin {
public:
    auto name() const -> std::string_view override { return "ui-capture"; }
    auto description() const -> std::string_view override { return "UI state capture and XML generation"; }

    auto run(std::vector<std::string> const& args, PluginContext& context) -> int override {
        UiCaptureOptions options;

        Cli::ArgumentParser parser;
        parser.set_program_name("garmin-dev ui-capture");
        parser.set_error_logger([&](std::string const& message) { context.err << message << '\n'; });
        parser.add_flag("--help", {.on_set = [&] { options.show_help = true; }});
        parser.add_value("--input", {.on_value = text_value(options.input, "--input")});
        parser.add_value("--output", {.on_value = [&](std::optional<std::string_view> token) -> Cli::ArgumentParser::ParseError {
                                  if (!token || token->empty()) {
                                      return std::string{"--output requires a value"};
                                  }
                                  options.output = std::string{*token};
                                  return std::nullopt;
                              }});
        parser.add_choice("--format", {"xml", "json"}, [&](std::string_view value) {
            if (auto parsed = Capture::ParseOutputFormat(value)) {
                options.format = *parsed;
            }
        });
        parser.add_value("--device", {.on_value = text_value(options.device, "--device")});
        parser.add_alias("-h", "--help");
        parser.add_alias("-i", "--input");
        parser.add_alias("-o", "--output");
        parser.add_alias("-f", "--format");
        parser.add_alias("-d", "--device");

        if (!parser.parse(args)) {
            print_usage(context.err);
            return 2;
        }
        if (options.show_help) {
            print_usage(context.out);
            return 0;
        }

        auto const device = options.device.value_or(context.config.default_device);

        context.out << "🎯 UI Capture Plugin\n";
        context.out << "Input: " << options.input.value_or("stdin") << '\n';
        context.out << "Output: " << options.output << '\n';
        context.out << "Format: " << Capture::OutputFormatName(options.format) << '\n';
        context.out << "Device: " << device << '\n';

        auto log = options.input ? ReadTextFile(*options.input) : ReadTextStream(context.in);
        if (!log) {
            context.err << "❌ Error processing logs: " << describeError(log.error()) << '\n';
            return 1;
        }

        auto document = Capture::ParseTraceLog(*log, {.device = device, .capture_time = std::nullopt});
        auto written  = WriteTextFile(options.output, Capture::Serialize(document, options.format));
        if (!written) {
            context.err << "❌ Error processing logs: " << describeError(written.error()) << '\n';
            return 1;
        }

        gd_log("Wrote " + options.output, "UiCapturePlugin");
        context.out << "✅ " << (options.format == Capture::OutputFormat::Xml ? "XML" : "JSON")
                    << " UI state saved to: " << options.output << '\n';
        context.out << "📊 Captured " << document.elements.size() << " UI elements\n";
        return 0;
    }
};

} // namespace

auto MakeUiCapturePlugin() -> std::unique_ptr<Plugin> {
    return std::make_unique<UiCapturePlugin>();
}

} // namespace GD::App
