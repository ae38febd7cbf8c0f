#include "repo/ClientOptions.hpp"

#include <array>
#include <cstdlib>
#include <optional>
#include <string_view>

#include <unistd.h>

namespace MS {

namespace {

auto readEnv(char const* name) -> std::optional<std::string> {
    if (auto* raw = std::getenv(name)) {
        std::string_view value{raw};
        if (!value.empty())
            return std::string{value};
    }
    return std::nullopt;
}

auto systemHostname() -> std::optional<std::string> {
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1) != 0)
        return std::nullopt;
    std::string host{buffer.data()};
    if (host.empty())
        return std::nullopt;
    return host;
}

} // namespace

auto ClientOptions::fromEnvironment() -> ClientOptions {
    ClientOptions options;

    if (auto user = readEnv("MANIFESTSPACE_USERNAME")) {
        options.username = std::move(*user);
    } else if (auto login = readEnv("USER")) {
        options.username = std::move(*login);
    } else if (auto logname = readEnv("LOGNAME")) {
        options.username = std::move(*logname);
    } else {
        options.username = "unknown";
    }

    if (auto host = readEnv("MANIFESTSPACE_HOSTNAME")) {
        options.hostname = std::move(*host);
    } else if (auto system = systemHostname()) {
        options.hostname = std::move(*system);
    } else {
        options.hostname = "unknown";
    }

    return options;
}

} // namespace MS
