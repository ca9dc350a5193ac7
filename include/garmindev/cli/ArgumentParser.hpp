#pragma once

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GD::Cli {

/**
 * Small option parser shared by the top-level command and the plugins.
 *
 * Options take the forms `--name`, `--name value` and `--name=value`; short
 * forms are registered with add_alias. Tokens that do not look like options
 * fill the registered positionals in order. Anything else goes to the
 * unknown-argument handler, which decides whether it is an error.
 */
class ArgumentParser {
public:
    using ParseError = std::optional<std::string>;

    ArgumentParser();

    void set_program_name(std::string_view name);
    void set_unknown_argument_handler(std::function<bool(std::string_view)> handler);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::optional<std::string_view>)> on_value;
        bool value_optional = false;
        bool allow_leading_dash_value = false;
    };

    struct IntOption {
        std::function<void(int)> on_value;
    };

    struct PositionalOption {
        std::function<ParseError(std::string_view)> on_value;
        bool required = false;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, IntOption option);
    void add_choice(std::string_view name,
                    std::vector<std::string> choices,
                    std::function<void(std::string_view)> on_value);
    void add_positional(std::string_view name, PositionalOption option);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] bool parse(std::vector<std::string> const& args);
    [[nodiscard]] bool had_errors() const;

    [[nodiscard]] auto program_name() const -> std::string const&;

private:
    struct OptionEntry {
        std::string name;
        bool expects_value = false;
        bool value_optional = false;
        bool allow_leading_dash_value = false;
        std::function<void()> flag_handler;
        std::function<ParseError(std::optional<std::string_view>)> value_handler;
    };

    struct PositionalEntry {
        std::string name;
        bool required = false;
        std::function<ParseError(std::string_view)> handler;
    };

    bool parse_tokens(std::vector<std::string_view> const& tokens);
    OptionEntry* find_option(std::string_view name);
    void register_option(OptionEntry entry);
    void log_error(std::string_view message);
    bool looks_like_option(std::string_view token) const;
    void mark_error();

    std::vector<OptionEntry> options_;
    phmap::flat_hash_map<std::string, std::size_t> option_lookup_;
    std::vector<PositionalEntry> positionals_;
    std::string program_name_;
    std::function<bool(std::string_view)> unknown_handler_;
    std::function<void(std::string const&)> error_logger_;
    bool had_error_ = false;
};

} // namespace GD::Cli
