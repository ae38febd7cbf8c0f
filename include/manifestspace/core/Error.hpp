#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace MS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        MalformedInput,
        InvalidPermissions,
        IOFailure,
        LookupFailed,
        LoadFailed,
        CommitFailed,
        RetireFailed
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidPermissions:
        return "invalid_permissions";
    case Error::Code::IOFailure:
        return "io_failure";
    case Error::Code::LookupFailed:
        return "lookup_failed";
    case Error::Code::LoadFailed:
        return "load_failed";
    case Error::Code::CommitFailed:
        return "commit_failed";
    case Error::Code::RetireFailed:
        return "retire_failed";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

/**
 * Wraps a lower level error with the stage that failed.
 * The message reads "context: <inner description>" so the whole chain stays visible.
 */
[[nodiscard]] inline auto wrapError(Error const& inner, Error::Code code, std::string_view context) -> Error {
    std::string message{context};
    message.append(": ");
    message.append(describeError(inner));
    return Error{code, std::move(message)};
}

} // namespace MS
