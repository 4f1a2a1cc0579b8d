/*
 * args.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-17

Description: Minimal long-option command line parser

**************************************************/

#ifndef OFFLOAD_UTILS_ARGS_HPP
#define OFFLOAD_UTILS_ARGS_HPP

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace offload::utils {

/**
 * @class ArgumentParser
 * @brief Parses `--name value`, `--name=value` and `--flag` options.
 */
class ArgumentParser {
public:
    explicit ArgumentParser(std::string programName);

    void setDescription(const std::string& description);

    /**
     * @brief Declares an option taking one value.
     * @throws offload::error::InvalidArgument on an invalid or duplicate name.
     */
    void addArgument(const std::string& name, const std::string& help,
                     std::optional<std::string> defaultValue = std::nullopt);

    void addFlag(const std::string& name, const std::string& help);

    /**
     * @brief Parses argv[1..]. `--help`/`-h` sets the help flag instead of
     * failing.
     * @throws offload::error::InvalidArgument on unknown options, missing
     * values or positional arguments.
     */
    void parse(std::span<const char* const> argv);

    [[nodiscard]] auto get(const std::string& name) const
        -> std::optional<std::string>;
    [[nodiscard]] auto getFlag(const std::string& name) const -> bool;
    [[nodiscard]] auto helpRequested() const -> bool { return help_; }

    [[nodiscard]] auto usage() const -> std::string;

private:
    struct Argument {
        std::string help;
        std::optional<std::string> defaultValue;
        std::optional<std::string> value;
    };

    struct Flag {
        std::string help;
        bool value{false};
    };

    static void validateName(const std::string& name);

    std::string programName_;
    std::string description_;
    std::map<std::string, Argument> arguments_;
    std::map<std::string, Flag> flags_;
    std::vector<std::string> order_;
    bool help_{false};
};

}  // namespace offload::utils

#endif  // OFFLOAD_UTILS_ARGS_HPP
