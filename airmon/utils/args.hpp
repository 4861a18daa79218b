/*
 * args.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Command line argument parser with subcommands

**************************************************/

#ifndef AIRMON_UTILS_ARGS_HPP
#define AIRMON_UTILS_ARGS_HPP

#include <any>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <typeinfo>
#include <vector>

#include "airmon/error/exception.hpp"

namespace airmon::utils {

/**
 * @brief Parses "--name value" options, "--flag" switches, positional
 * arguments and one level of subcommands.
 *
 * Options and flags declared on the root parser must precede the
 * subcommand; everything after it is handed to the subcommand's parser.
 */
class ArgumentParser {
public:
    enum class ArgType { STRING, INTEGER, DOUBLE };

    ArgumentParser() = default;
    explicit ArgumentParser(std::string programName);

    void setDescription(const std::string& description);

    void addArgument(const std::string& name, ArgType type = ArgType::STRING,
                     const std::any& defaultValue = {},
                     const std::string& help = "",
                     const std::vector<std::string>& aliases = {});

    void addFlag(const std::string& name, const std::string& help = "",
                 const std::vector<std::string>& aliases = {});

    /**
     * @brief Declare a positional argument. Positionals are filled in
     * declaration order; missing ones stay empty.
     */
    void addPositional(const std::string& name, const std::string& help = "");

    /**
     * @brief Register a subcommand and return its parser for configuration.
     */
    auto addSubcommand(const std::string& name, const std::string& help = "")
        -> ArgumentParser&;

    /**
     * @param argv full command line including the program name
     * @throws airmon::error::InvalidArgument on unknown options, missing
     * values, unparsable values or surplus positionals
     */
    void parse(std::span<const std::string> argv);

    template <typename T>
    [[nodiscard]] auto get(const std::string& name) const -> std::optional<T>;

    [[nodiscard]] auto getFlag(const std::string& name) const -> bool;

    [[nodiscard]] auto getPositional(const std::string& name) const
        -> std::optional<std::string>;

    /// Name of the subcommand on the command line, empty when none.
    [[nodiscard]] auto activeSubcommand() const -> const std::string&;

    [[nodiscard]] auto subcommand(const std::string& name) const
        -> const ArgumentParser&;

    /// True when "-h" or "--help" appeared at this level.
    [[nodiscard]] auto helpRequested() const -> bool;

    [[nodiscard]] auto helpText() const -> std::string;

private:
    struct Argument {
        ArgType type{ArgType::STRING};
        std::any defaultValue;
        std::optional<std::any> value;
        std::string help;
    };

    struct Flag {
        bool value{false};
        std::string help;
    };

    struct Positional {
        std::string name;
        std::string help;
        std::optional<std::string> value;
    };

    struct Subcommand {
        std::string help;
        std::unique_ptr<ArgumentParser> parser;
    };

    static auto parseValue(ArgType type, const std::string& name,
                           const std::string& text) -> std::any;
    auto resolveAlias(const std::string& name) const -> std::string;

    std::string programName_;
    std::string description_;
    std::map<std::string, Argument> arguments_;
    std::map<std::string, Flag> flags_;
    std::map<std::string, std::string> aliases_;
    std::vector<Positional> positionals_;
    std::map<std::string, Subcommand> subcommands_;
    std::string activeSubcommand_;
    bool helpRequested_{false};
};

template <typename T>
auto ArgumentParser::get(const std::string& name) const -> std::optional<T> {
    auto it = arguments_.find(name);
    if (it == arguments_.end()) {
        return std::nullopt;
    }
    const std::any& stored =
        it->second.value ? *it->second.value : it->second.defaultValue;
    if (!stored.has_value()) {
        return std::nullopt;
    }
    try {
        return std::any_cast<T>(stored);
    } catch (const std::bad_any_cast&) {
        THROW_INVALID_ARGUMENT("Type mismatch for argument: ", name);
    }
}

}  // namespace airmon::utils

#endif  // AIRMON_UTILS_ARGS_HPP
