#include "CommandLine.hpp"

#include <charconv>
#include <iostream>
#include <string>

namespace PK::CLI {

void CommandLine::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void CommandLine::add_unsigned(std::string_view name, UnsignedOption option) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires an unsigned integer value";
        }
        std::uint64_t value = 0;
        auto begin = token.data();
        auto end = begin + token.size();
        auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects a numeric value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
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

bool CommandLine::parse(int argc, char** argv, int first) {
    std::vector<std::string> tokens;
    for (int i = first; i < argc; ++i) {
        tokens.emplace_back(argv[i]);
    }
    return parse(tokens);
}

bool CommandLine::parse(std::vector<std::string> const& tokens) {
    had_error_ = false;
    positionals_.clear();
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        std::string_view raw_token{tokens[i]};
        std::optional<std::string_view> attached_value;
        std::string_view name = raw_token;
        auto equals_pos = raw_token.find('=');
        if (raw_token.starts_with("--") && equals_pos != std::string_view::npos) {
            name = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            take_unregistered(raw_token);
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                mark_error();
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else if ((i + 1) < tokens.size()) {
            ++i;
            value = std::string_view{tokens[i]};
        } else {
            log_error(entry->name + " requires a value");
            mark_error();
            continue;
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
                mark_error();
            }
        }
    }
    return !had_error_;
}

auto CommandLine::positionals() const -> std::vector<std::string> const& {
    return positionals_;
}

CommandLine::OptionEntry* CommandLine::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void CommandLine::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"pathkit"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

void CommandLine::mark_error() {
    had_error_ = true;
}

void CommandLine::take_unregistered(std::string_view token) {
    if (token.size() > 1 && token.front() == '-') {
        std::string message = "unknown option '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        log_error(message);
        mark_error();
        return;
    }
    positionals_.emplace_back(token);
}

} // namespace PK::CLI
