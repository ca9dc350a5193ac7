#include <garmindev/cli/ArgumentParser.hpp>

#include <algorithm>
#include <charconv>
#include <iostream>
#include <string>
#include <utility>

namespace GD::Cli {

ArgumentParser::ArgumentParser() {
    unknown_handler_ = [this](std::string_view token) {
        std::string message = "unrecognized argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        log_error(message);
        return false;
    };
}

void ArgumentParser::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void ArgumentParser::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void ArgumentParser::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void ArgumentParser::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = false;
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void ArgumentParser::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_optional = option.value_optional;
    entry.allow_leading_dash_value = option.allow_leading_dash_value;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void ArgumentParser::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::optional<std::string_view> token) -> ParseError {
        if (!token || token->empty()) {
            return stored + " requires an integer value";
        }
        int value = 0;
        auto begin = token->data();
        auto end = begin + token->size();
        auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects a numeric value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void ArgumentParser::add_choice(std::string_view name,
                                std::vector<std::string> choices,
                                std::function<void(std::string_view)> on_value) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), choices = std::move(choices), handler = std::move(on_value)](std::optional<std::string_view> token) -> ParseError {
        if (!token || token->empty()) {
            return stored + " requires a value";
        }
        if (std::find(choices.begin(), choices.end(), *token) == choices.end()) {
            std::string message = stored + ": invalid choice '";
            message.append(token->begin(), token->end());
            message.append("' (choose from ");
            for (std::size_t i = 0; i < choices.size(); ++i) {
                if (i != 0) {
                    message.append(", ");
                }
                message.append(choices[i]);
            }
            message.push_back(')');
            return message;
        }
        handler(*token);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void ArgumentParser::add_positional(std::string_view name, PositionalOption option) {
    PositionalEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.required = option.required;
    entry.handler = std::move(option.on_value);
    positionals_.push_back(std::move(entry));
}

void ArgumentParser::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        mark_error();
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool ArgumentParser::parse(int argc, char** argv) {
    std::vector<std::string_view> tokens;
    tokens.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
    for (int i = 1; i < argc; ++i) {
        tokens.emplace_back(argv[i]);
    }
    return parse_tokens(tokens);
}

bool ArgumentParser::parse(std::vector<std::string> const& args) {
    std::vector<std::string_view> tokens(args.begin(), args.end());
    return parse_tokens(tokens);
}

bool ArgumentParser::parse_tokens(std::vector<std::string_view> const& tokens) {
    had_error_ = false;
    std::size_t next_positional = 0;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        std::string_view raw_token = tokens[i];
        std::optional<std::string_view> attached_value;
        std::string_view name = raw_token;
        auto equals_pos = raw_token.find('=');
        if (looks_like_option(raw_token) && equals_pos != std::string_view::npos) {
            name = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = looks_like_option(raw_token) ? find_option(name) : nullptr;
        if (entry == nullptr) {
            if (!looks_like_option(raw_token) && next_positional < positionals_.size()) {
                auto& positional = positionals_[next_positional++];
                if (positional.handler) {
                    if (auto error = positional.handler(raw_token)) {
                        log_error(*error);
                        mark_error();
                    }
                }
                continue;
            }
            if (unknown_handler_) {
                bool ok = unknown_handler_(raw_token);
                if (!ok) {
                    mark_error();
                }
            }
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value && !attached_value->empty()) {
                log_error(entry->name + " does not accept a value");
                mark_error();
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::optional<std::string_view> resolved_value = attached_value;
        if (!resolved_value) {
            bool has_next = (i + 1) < tokens.size();
            bool next_is_option = has_next && looks_like_option(tokens[i + 1]) && !entry->allow_leading_dash_value;
            if (has_next && !next_is_option) {
                resolved_value = tokens[++i];
            } else if (!entry->value_optional) {
                log_error(entry->name + " requires a value");
                mark_error();
                continue;
            }
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(resolved_value)) {
                log_error(*error);
                mark_error();
            }
        }
    }

    for (std::size_t i = next_positional; i < positionals_.size(); ++i) {
        if (positionals_[i].required) {
            log_error("missing required argument '" + positionals_[i].name + "'");
            mark_error();
        }
    }
    return !had_error_;
}

bool ArgumentParser::had_errors() const {
    return had_error_;
}

auto ArgumentParser::program_name() const -> std::string const& {
    return program_name_;
}

ArgumentParser::OptionEntry* ArgumentParser::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void ArgumentParser::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void ArgumentParser::log_error(std::string_view message) {
    std::string text;
    if (program_name_.empty()) {
        text.assign("garmin-dev");
    } else {
        text = program_name_;
    }
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool ArgumentParser::looks_like_option(std::string_view token) const {
    return token.size() > 1 && token.front() == '-';
}

void ArgumentParser::mark_error() {
    had_error_ = true;
}

} // namespace GD::Cli
