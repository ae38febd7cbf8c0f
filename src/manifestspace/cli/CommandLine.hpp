#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MS::CLI {

/**
 * Option table for "<program> [options] <positionals>" style commands.
 *
 * Options are long names ("--repo") or registered aliases ("-h"). Options may appear
 * anywhere among the positionals; "--" ends option parsing. Value and integer options
 * take "--name=value" or the following token. Boolean options take "--name" (true) or
 * "--name=<true|false|1|0|yes|no>" and never consume the following token.
 *
 * parse() stops at the first error and returns it as MalformedInput.
 */
class CommandLine {
public:
    using ValueHandler = std::function<Expected<void>(std::string_view)>;

    auto flag(std::string name, std::function<void()> onSet) -> CommandLine&;
    auto value(std::string name, ValueHandler onValue) -> CommandLine&;
    auto boolean(std::string name, std::function<void(bool)> onValue) -> CommandLine&;
    auto integer(std::string name, std::function<void(std::int64_t)> onValue) -> CommandLine&;
    auto alias(std::string alias, std::string target) -> CommandLine&;

    // Returns the positional arguments, argv[0] excluded.
    [[nodiscard]] auto parse(int argc, char const* const* argv) const -> Expected<std::vector<std::string>>;

private:
    enum class Kind {
        Flag,
        Value,
        Bool,
        Int,
    };

    struct Option {
        Kind kind = Kind::Flag;
        // Receives the attached or following value; nullopt for a bare flag or boolean.
        std::function<Expected<void>(std::optional<std::string_view>)> apply;
    };

    [[nodiscard]] auto find(std::string_view name) const -> Option const*;

    std::map<std::string, Option, std::less<>>      options;
    std::map<std::string, std::string, std::less<>> aliases;
};

// "true"/"false", "1"/"0", "yes"/"no" (case sensitive).
[[nodiscard]] auto parseBool(std::string_view text) -> std::optional<bool>;

// Whole token as a signed decimal; no sign-only, partial or out of range input.
[[nodiscard]] auto parseInt(std::string_view text) -> std::optional<std::int64_t>;

} // namespace MS::CLI
