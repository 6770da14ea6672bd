#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace PK::CLI {

// Option parser for the pathkit tool. Tokens that are not registered options
// are collected as positional arguments; unregistered "-x" tokens are errors.
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    void set_program_name(std::string_view name);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
    };

    struct UnsignedOption {
        std::function<void(std::uint64_t)> on_value;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_unsigned(std::string_view name, UnsignedOption option);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char** argv, int first = 1);
    [[nodiscard]] bool parse(std::vector<std::string> const& tokens);
    [[nodiscard]] auto positionals() const -> std::vector<std::string> const&;

private:
    struct OptionEntry {
        std::string name;
        bool expects_value = false;
        std::function<void()> flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void register_option(OptionEntry entry);
    void log_error(std::string_view message);
    void mark_error();
    void take_unregistered(std::string_view token);

    std::vector<OptionEntry> options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::vector<std::string> positionals_;
    std::string program_name_;
    std::function<void(std::string const&)> error_logger_;
    bool had_error_ = false;
};

} // namespace PK::CLI
