#include "cli/CommandLine.hpp"

#include <charconv>
#include <utility>

namespace MS::CLI {

namespace {

auto malformed(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::MalformedInput, std::move(message)});
}

auto isOptionToken(std::string_view token) -> bool {
    return token.size() > 1 && token.front() == '-';
}

} // namespace

auto parseBool(std::string_view text) -> std::optional<bool> {
    if (text == "true" || text == "1" || text == "yes")
        return true;
    if (text == "false" || text == "0" || text == "no")
        return false;
    return std::nullopt;
}

auto parseInt(std::string_view text) -> std::optional<std::int64_t> {
    if (text.starts_with('+')) {
        text.remove_prefix(1);
        if (text.starts_with('-'))
            return std::nullopt;
    }
    std::int64_t value = 0;
    auto const*  end   = text.data() + text.size();
    auto [ptr, ec]     = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end)
        return std::nullopt;
    return value;
}

auto CommandLine::flag(std::string name, std::function<void()> onSet) -> CommandLine& {
    auto optionName = name;
    this->options[std::move(name)] = Option{
        .kind  = Kind::Flag,
        .apply = [optionName, onSet = std::move(onSet)](std::optional<std::string_view> attached) -> Expected<void> {
            if (attached)
                return malformed("option '" + optionName + "' takes no value");
            onSet();
            return {};
        }};
    return *this;
}

auto CommandLine::value(std::string name, ValueHandler onValue) -> CommandLine& {
    this->options[std::move(name)] = Option{
        .kind  = Kind::Value,
        .apply = [onValue = std::move(onValue)](std::optional<std::string_view> text) -> Expected<void> {
            return onValue(*text);
        }};
    return *this;
}

auto CommandLine::boolean(std::string name, std::function<void(bool)> onValue) -> CommandLine& {
    auto optionName = name;
    this->options[std::move(name)] = Option{
        .kind  = Kind::Bool,
        .apply = [optionName, onValue = std::move(onValue)](std::optional<std::string_view> text) -> Expected<void> {
            if (!text) {
                onValue(true);
                return {};
            }
            auto parsed = parseBool(*text);
            if (!parsed)
                return malformed("option '" + optionName + "': '" + std::string(*text) + "' is not a boolean");
            onValue(*parsed);
            return {};
        }};
    return *this;
}

auto CommandLine::integer(std::string name, std::function<void(std::int64_t)> onValue) -> CommandLine& {
    auto optionName = name;
    this->options[std::move(name)] = Option{
        .kind  = Kind::Int,
        .apply = [optionName, onValue = std::move(onValue)](std::optional<std::string_view> text) -> Expected<void> {
            auto parsed = parseInt(*text);
            if (!parsed)
                return malformed("option '" + optionName + "': '" + std::string(*text) + "' is not an integer");
            onValue(*parsed);
            return {};
        }};
    return *this;
}

auto CommandLine::alias(std::string alias, std::string target) -> CommandLine& {
    this->aliases[std::move(alias)] = std::move(target);
    return *this;
}

auto CommandLine::find(std::string_view name) const -> Option const* {
    if (auto it = this->aliases.find(name); it != this->aliases.end())
        name = it->second;
    auto it = this->options.find(name);
    return it == this->options.end() ? nullptr : &it->second;
}

auto CommandLine::parse(int argc, char const* const* argv) const -> Expected<std::vector<std::string>> {
    std::vector<std::string> positionals;
    bool                     optionsEnded = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view token{argv[i]};
        if (optionsEnded || !isOptionToken(token)) {
            positionals.emplace_back(token);
            continue;
        }
        if (token == "--") {
            optionsEnded = true;
            continue;
        }

        std::optional<std::string_view> attached;
        auto                            name = token;
        if (auto eq = token.find('='); eq != std::string_view::npos) {
            name     = token.substr(0, eq);
            attached = token.substr(eq + 1);
        }

        auto const* option = this->find(name);
        if (option == nullptr)
            return malformed("unknown option '" + std::string(name) + "'");

        auto text = attached;
        if (!text && (option->kind == Kind::Value || option->kind == Kind::Int)) {
            if (i + 1 >= argc)
                return malformed("option '" + std::string(name) + "' requires a value");
            text = std::string_view{argv[++i]};
        }
        if (auto applied = option->apply(text); !applied)
            return std::unexpected(applied.error());
    }
    return positionals;
}

} // namespace MS::CLI
