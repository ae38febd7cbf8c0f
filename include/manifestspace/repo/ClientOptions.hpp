#pragma once

#include <string>

namespace MS {

struct ClientOptions {
    std::string username;
    std::string hostname;

    [[nodiscard]] auto usernameAtHost() const -> std::string { return username + "@" + hostname; }

    /**
     * Identity of the current process.
     * MANIFESTSPACE_USERNAME / MANIFESTSPACE_HOSTNAME take precedence, then USER (or
     * LOGNAME) and gethostname(). Missing values fall back to "unknown".
     */
    [[nodiscard]] static auto fromEnvironment() -> ClientOptions;
};

} // namespace MS
