#include <garmindev/app/Application.hpp>

#include <garmindev/app/DevConfig.hpp>
#include <garmindev/app/Plugin.hpp>
#include <garmindev/cli/ArgumentParser.hpp>

#include "log/TaggedLogger.hpp"

#include <iomanip>
#include <istream>
#include <optional>
#include <ostream>
#include <utility>

namespace GD::App {

namespace {

struct GlobalOptions {
    std::optional<std::string>           command;
    std::vector<std::string>             forwarded;
    std::optional<std::filesystem::path> config_path;
    bool                                 version      = false;
    bool                                 list_plugins = false;
    bool                                 verbose      = false;
    bool                                 json         = false;
    bool                                 help         = false;
};

void print_help(std::ostream& out, PluginRegistry const& registry) {
    out << "Garmin Connect IQ Development CLI v" << kVersion << '\n';
    out << "A micro-kernel CLI for Garmin development\n\n";
    out << "Usage: garmin-dev <command> [options]\n\n";
    out << "Commands:\n";
    for (auto const& plugin : registry.plugins()) {
        out << "  " << std::left << std::setw(12) << plugin->name() << ' ' << plugin->description() << '\n';
    }
    out << '\n';
    out << "Global Options:\n"
           "  --version, -V       Show version\n"
           "  --list-plugins, -L  List available plugins\n"
           "  --config, -c        Config file path\n"
           "  --verbose, -v       Verbose output\n"
           "  --json              JSON output format\n"
           "  --help, -h          Show help\n\n";
    out << "Examples:\n"
           "  garmin-dev ui-capture --input debug.log --output ui-state.xml\n"
           "  garmin-dev build --device fenix7 --optimize\n"
           "  garmin-dev deploy app.prg --simulator\n";
}

auto parse_globals(std::vector<std::string> const& args, std::ostream& err) -> std::optional<GlobalOptions> {
    GlobalOptions options;

    Cli::ArgumentParser parser;
    parser.set_program_name("garmin-dev");
    parser.set_error_logger([&](std::string const& message) { err << message << '\n'; });
    parser.set_unknown_argument_handler([&](std::string_view token) {
        options.forwarded.emplace_back(token);
        return true;
    });
    parser.add_positional("command", {.on_value = [&](std::string_view token) -> Cli::ArgumentParser::ParseError {
                                          options.command = std::string{token};
                                          return std::nullopt;
                                      }});
    parser.add_flag("--version", {.on_set = [&] { options.version = true; }});
    parser.add_flag("--list-plugins", {.on_set = [&] { options.list_plugins = true; }});
    parser.add_value("--config", {.on_value = [&](std::optional<std::string_view> token) -> Cli::ArgumentParser::ParseError {
                                      if (!token || token->empty()) {
                                          return std::string{"--config requires a value"};
                                      }
                                      options.config_path = std::filesystem::path{std::string{*token}};
                                      return std::nullopt;
                                  }});
    parser.add_flag("--verbose", {.on_set = [&] { options.verbose = true; }});
    parser.add_flag("--json", {.on_set = [&] { options.json = true; }});
    parser.add_flag("--help", {.on_set = [&] {
                                   if (options.command) {
                                       options.forwarded.emplace_back("--help");
                                   } else {
                                       options.help = true;
                                   }
                               }});
    parser.add_alias("-V", "--version");
    parser.add_alias("-L", "--list-plugins");
    parser.add_alias("-c", "--config");
    parser.add_alias("-v", "--verbose");
    parser.add_alias("-h", "--help");

    if (!parser.parse(args)) {
        return std::nullopt;
    }
    return options;
}

auto resolve_config(GlobalOptions const& options, ApplicationPaths const& paths, std::ostream& err) -> std::optional<DevConfig> {
    auto warn = [&](std::string const& message) { err << message << '\n'; };

    auto loaded = LoadDevConfig(options.config_path, paths.config_search, warn);
    if (!loaded) {
        err << "Error: failed to load config: " << describeError(loaded.error()) << '\n';
        return std::nullopt;
    }
    auto config = std::move(*loaded);
    if (!ApplyDevEnvOverrides(config, warn)) {
        return std::nullopt;
    }
    if (options.verbose) {
        config.verbose = true;
    }
    if (options.json) {
        config.output_format = "json";
    }
    if (auto problem = ValidateDevConfig(config)) {
        err << "Error: invalid configuration: " << *problem << '\n';
        return std::nullopt;
    }
    if (!config.sdk_path) {
        config.sdk_path = FindGarminSdk(paths.sdk_search);
    }
    return config;
}

} // namespace

auto DefaultApplicationPaths() -> ApplicationPaths {
    return ApplicationPaths{.config_search = DefaultConfigSearchPaths(), .sdk_search = DefaultSdkSearchPaths()};
}

auto RunApplication(std::vector<std::string> const& args,
                    std::istream& in,
                    std::ostream& out,
                    std::ostream& err,
                    ApplicationPaths const& paths) -> int {
    auto options = parse_globals(args, err);
    if (!options) {
        return 2;
    }

    auto config = resolve_config(*options, paths, err);
    if (!config) {
        return 1;
    }

#ifdef GD_LOG_DEBUG
    if (config->verbose) {
        set_logging_enabled(true);
    }
    gd_log("Configuration source: " + (config->source ? config->source->string() : std::string{"defaults"}), "Application");
#endif

    auto registry = MakeBuiltinRegistry();
    int  status   = 0;
    if (options->version) {
        out << "garmin-dev " << kVersion << '\n';
    } else if (options->list_plugins) {
        registry.list(out, config->output_format == "json");
    } else if (options->help || !options->command) {
        print_help(out, registry);
    } else {
        PluginContext context{.config = *config, .in = in, .out = out, .err = err};
        status = registry.run(*options->command, options->forwarded, context);
    }

#ifdef GD_LOG_DEBUG
    flush_log();
#endif
    return status;
}

auto RunApplication(std::vector<std::string> const& args, std::istream& in, std::ostream& out, std::ostream& err) -> int {
    return RunApplication(args, in, out, err, DefaultApplicationPaths());
}

} // namespace GD::App
