/*
 * args.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Command line argument parser with subcommands

**************************************************/

#include "args.hpp"

#include <sstream>

namespace airmon::utils {

ArgumentParser::ArgumentParser(std::string programName)
    : programName_(std::move(programName)) {}

void ArgumentParser::setDescription(const std::string& description) {
    description_ = description;
}

void ArgumentParser::addArgument(const std::string& name, ArgType type,
                                 const std::any& defaultValue,
                                 const std::string& help,
                                 const std::vector<std::string>& aliases) {
    if (name.empty()) {
        THROW_INVALID_ARGUMENT("Argument name cannot be empty");
    }
    arguments_[name] = Argument{type, defaultValue, std::nullopt, help};
    for (const auto& alias : aliases) {
        aliases_[alias] = name;
    }
}

void ArgumentParser::addFlag(const std::string& name, const std::string& help,
                             const std::vector<std::string>& aliases) {
    if (name.empty()) {
        THROW_INVALID_ARGUMENT("Flag name cannot be empty");
    }
    flags_[name] = Flag{false, help};
    for (const auto& alias : aliases) {
        aliases_[alias] = name;
    }
}

void ArgumentParser::addPositional(const std::string& name,
                                   const std::string& help) {
    positionals_.push_back(Positional{name, help, std::nullopt});
}

auto ArgumentParser::addSubcommand(const std::string& name,
                                   const std::string& help)
    -> ArgumentParser& {
    auto& entry = subcommands_[name];
    entry.help = help;
    entry.parser = std::make_unique<ArgumentParser>(programName_ + " " + name);
    entry.parser->setDescription(help);
    return *entry.parser;
}

auto ArgumentParser::resolveAlias(const std::string& name) const
    -> std::string {
    auto it = aliases_.find(name);
    return it == aliases_.end() ? name : it->second;
}

auto ArgumentParser::parseValue(ArgType type, const std::string& name,
                                const std::string& text) -> std::any {
    try {
        std::size_t consumed = 0;
        switch (type) {
            case ArgType::INTEGER: {
                int value = std::stoi(text, &consumed);
                if (consumed == text.size()) {
                    return value;
                }
                break;
            }
            case ArgType::DOUBLE: {
                double value = std::stod(text, &consumed);
                if (consumed == text.size()) {
                    return value;
                }
                break;
            }
            case ArgType::STRING:
                return text;
        }
    } catch (const std::exception&) {
        // Reported below with the argument name.
    }
    THROW_INVALID_ARGUMENT("Invalid value for --", name, ": ", text);
}

void ArgumentParser::parse(std::span<const std::string> argv) {
    if (argv.empty()) {
        THROW_INVALID_ARGUMENT("Empty command line arguments");
    }

    std::size_t nextPositional = 0;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            helpRequested_ = true;
            continue;
        }

        if (arg.size() > 1 && arg.starts_with("-")) {
            std::string argName =
                arg.starts_with("--") ? arg.substr(2) : arg.substr(1);
            std::optional<std::string> inlineValue;
            if (auto eq = argName.find('='); eq != std::string::npos) {
                inlineValue = argName.substr(eq + 1);
                argName = argName.substr(0, eq);
            }
            argName = resolveAlias(argName);

            if (auto flag = flags_.find(argName); flag != flags_.end()) {
                if (inlineValue) {
                    THROW_INVALID_ARGUMENT("Flag --", argName,
                                           " does not take a value");
                }
                flag->second.value = true;
                continue;
            }

            if (auto option = arguments_.find(argName);
                option != arguments_.end()) {
                std::string text;
                if (inlineValue) {
                    text = *inlineValue;
                } else if (i + 1 < argv.size()) {
                    text = argv[++i];
                } else {
                    THROW_INVALID_ARGUMENT("Missing value for --", argName);
                }
                option->second.value =
                    parseValue(option->second.type, argName, text);
                continue;
            }

            THROW_INVALID_ARGUMENT("Unknown argument: ", arg);
        }

        if (activeSubcommand_.empty() && nextPositional == 0) {
            if (auto sub = subcommands_.find(arg); sub != subcommands_.end()) {
                activeSubcommand_ = arg;
                std::vector<std::string> rest;
                rest.push_back(programName_ + " " + arg);
                rest.insert(rest.end(), argv.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                            argv.end());
                sub->second.parser->parse(rest);
                return;
            }
        }

        if (nextPositional >= positionals_.size()) {
            if (!subcommands_.empty() && activeSubcommand_.empty()) {
                THROW_INVALID_ARGUMENT("Unknown command: ", arg);
            }
            THROW_INVALID_ARGUMENT("Unexpected argument: ", arg);
        }
        positionals_[nextPositional++].value = arg;
    }
}

auto ArgumentParser::getFlag(const std::string& name) const -> bool {
    auto it = flags_.find(name);
    return it != flags_.end() && it->second.value;
}

auto ArgumentParser::getPositional(const std::string& name) const
    -> std::optional<std::string> {
    for (const auto& positional : positionals_) {
        if (positional.name == name) {
            return positional.value;
        }
    }
    return std::nullopt;
}

auto ArgumentParser::activeSubcommand() const -> const std::string& {
    return activeSubcommand_;
}

auto ArgumentParser::subcommand(const std::string& name) const
    -> const ArgumentParser& {
    auto it = subcommands_.find(name);
    if (it == subcommands_.end()) {
        THROW_NOT_FOUND("Unknown subcommand: ", name);
    }
    return *it->second.parser;
}

auto ArgumentParser::helpRequested() const -> bool { return helpRequested_; }

auto ArgumentParser::helpText() const -> std::string {
    std::ostringstream oss;
    oss << "Usage: " << programName_;
    if (!arguments_.empty() || !flags_.empty()) {
        oss << " [options]";
    }
    if (!subcommands_.empty()) {
        oss << " <command>";
    }
    for (const auto& positional : positionals_) {
        oss << " <" << positional.name << ">";
    }
    oss << "\n";
    if (!description_.empty()) {
        oss << "\n" << description_ << "\n";
    }
    if (!subcommands_.empty()) {
        oss << "\nCommands:\n";
        for (const auto& [name, sub] : subcommands_) {
            oss << "  " << name << "\t" << sub.help << "\n";
        }
    }
    if (!positionals_.empty()) {
        oss << "\nArguments:\n";
        for (const auto& positional : positionals_) {
            oss << "  " << positional.name << "\t" << positional.help << "\n";
        }
    }
    if (!arguments_.empty() || !flags_.empty()) {
        oss << "\nOptions:\n";
        for (const auto& [name, argument] : arguments_) {
            oss << "  --" << name << " <value>\t" << argument.help << "\n";
        }
        for (const auto& [name, flag] : flags_) {
            oss << "  --" << name << "\t" << flag.help << "\n";
        }
    }
    oss << "  -h, --help\tShow this help\n";
    return oss.str();
}

}  // namespace airmon::utils
