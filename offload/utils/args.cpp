/*
 * args.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-17

Description: Minimal long-option command line parser

**************************************************/

#include "args.hpp"

#include <sstream>

#include "offload/error/exception.hpp"

namespace offload::utils {

ArgumentParser::ArgumentParser(std::string programName)
    : programName_(std::move(programName)) {}

void ArgumentParser::setDescription(const std::string& description) {
    description_ = description;
}

void ArgumentParser::validateName(const std::string& name) {
    if (name.empty()) {
        THROW_INVALID_ARGUMENT("Argument name cannot be empty");
    }
    if (name.find(' ') != std::string::npos) {
        THROW_INVALID_ARGUMENT("Argument name cannot contain spaces");
    }
    if (name.starts_with('-')) {
        THROW_INVALID_ARGUMENT("Argument name cannot start with '-'");
    }
}

void ArgumentParser::addArgument(const std::string& name,
                                 const std::string& help,
                                 std::optional<std::string> defaultValue) {
    validateName(name);
    if (arguments_.contains(name) || flags_.contains(name)) {
        THROW_INVALID_ARGUMENT("Duplicate argument: ", name);
    }
    arguments_.emplace(name, Argument{help, std::move(defaultValue), {}});
    order_.push_back(name);
}

void ArgumentParser::addFlag(const std::string& name, const std::string& help) {
    validateName(name);
    if (arguments_.contains(name) || flags_.contains(name)) {
        THROW_INVALID_ARGUMENT("Duplicate argument: ", name);
    }
    flags_.emplace(name, Flag{help, false});
    order_.push_back(name);
}

void ArgumentParser::parse(std::span<const char* const> argv) {
    for (std::size_t i = 1; i < argv.size(); ++i) {
        const std::string arg = argv[i] != nullptr ? argv[i] : "";
        if (arg == "--help" || arg == "-h") {
            help_ = true;
            continue;
        }
        if (!arg.starts_with("--")) {
            THROW_INVALID_ARGUMENT("Unexpected argument: ", arg);
        }

        std::string name = arg.substr(2);
        std::optional<std::string> inlineValue;
        if (auto eq = name.find('='); eq != std::string::npos) {
            inlineValue = name.substr(eq + 1);
            name.erase(eq);
        }

        if (auto flag = flags_.find(name); flag != flags_.end()) {
            if (inlineValue) {
                THROW_INVALID_ARGUMENT("Flag --", name, " takes no value");
            }
            flag->second.value = true;
            continue;
        }

        auto argument = arguments_.find(name);
        if (argument == arguments_.end()) {
            THROW_INVALID_ARGUMENT("Unknown argument: ", arg);
        }
        if (inlineValue) {
            argument->second.value = std::move(inlineValue);
        } else if (i + 1 < argv.size() && argv[i + 1] != nullptr) {
            argument->second.value = std::string(argv[++i]);
        } else {
            THROW_INVALID_ARGUMENT("Argument --", name, " expects a value");
        }
    }
}

auto ArgumentParser::get(const std::string& name) const
    -> std::optional<std::string> {
    auto it = arguments_.find(name);
    if (it == arguments_.end()) {
        return std::nullopt;
    }
    return it->second.value ? it->second.value : it->second.defaultValue;
}

auto ArgumentParser::getFlag(const std::string& name) const -> bool {
    auto it = flags_.find(name);
    return it != flags_.end() && it->second.value;
}

auto ArgumentParser::usage() const -> std::string {
    std::ostringstream out;
    out << "Usage: " << programName_ << " [options]\n";
    if (!description_.empty()) {
        out << "\n" << description_ << "\n";
    }
    out << "\nOptions:\n";
    for (const auto& name : order_) {
        if (auto arg = arguments_.find(name); arg != arguments_.end()) {
            out << "  --" << name << " <value>\n      " << arg->second.help;
            if (arg->second.defaultValue) {
                out << " (default: " << *arg->second.defaultValue << ")";
            }
            out << "\n";
        } else {
            out << "  --" << name << "\n      " << flags_.at(name).help << "\n";
        }
    }
    out << "  --help\n      Show this message\n";
    return out.str();
}

}  // namespace offload::utils
