#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace GD::App {

inline constexpr std::string_view kVersion = "0.1.0";

// Where configuration files and SDK installs are looked up.
struct ApplicationPaths {
    std::vector<std::filesystem::path> config_search;
    std::vector<std::filesystem::path> sdk_search;
};

[[nodiscard]] auto DefaultApplicationPaths() -> ApplicationPaths;

/**
 * Runs one `garmin-dev` invocation and returns its exit code.
 *
 * `args` excludes the program name. Global options are consumed wherever they
 * appear; the first positional names the command and every other token is
 * handed to that command in order. `--help` after the command belongs to the
 * command.
 */
auto RunApplication(std::vector<std::string> const& args,
                    std::istream& in,
                    std::ostream& out,
                    std::ostream& err,
                    ApplicationPaths const& paths) -> int;

auto RunApplication(std::vector<std::string> const& args, std::istream& in, std::ostream& out, std::ostream& err) -> int;

} // namespace GD::App
