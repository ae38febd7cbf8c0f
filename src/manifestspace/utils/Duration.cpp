#include "utils/Duration.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <utility>

namespace MS::Utils {

namespace {

struct UnitEntry {
    std::string_view name;
    std::uint64_t    nanos;
};

constexpr std::array<UnitEntry, 8> kUnits{{
    {"ns", 1ULL},
    {"us", 1'000ULL},
    {"\xC2\xB5s", 1'000ULL}, // U+00B5 micro sign
    {"\xCE\xBCs", 1'000ULL}, // U+03BC greek mu
    {"ms", 1'000'000ULL},
    {"s", 1'000'000'000ULL},
    {"m", 60'000'000'000ULL},
    {"h", 3'600'000'000'000ULL},
}};

constexpr std::uint64_t kMaxNanos = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

auto invalid(std::string_view text, std::string_view reason) -> Error {
    std::string message = "invalid duration '";
    message.append(text);
    message.append("': ");
    message.append(reason);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto isDigit(char ch) -> bool {
    return ch >= '0' && ch <= '9';
}

auto appendFraction(std::string& out, std::uint64_t whole, std::uint64_t fraction, int digits) -> void {
    out += std::to_string(whole);
    if (fraction == 0)
        return;
    std::string frac(static_cast<std::size_t>(digits), '0');
    for (int i = digits - 1; i >= 0; --i) {
        frac[static_cast<std::size_t>(i)] = static_cast<char>('0' + fraction % 10);
        fraction /= 10;
    }
    while (!frac.empty() && frac.back() == '0')
        frac.pop_back();
    out.push_back('.');
    out += frac;
}

} // namespace

auto parseDuration(std::string_view text) -> Expected<std::chrono::nanoseconds> {
    auto rest     = text;
    bool negative = false;
    if (!rest.empty() && (rest.front() == '-' || rest.front() == '+')) {
        negative = rest.front() == '-';
        rest.remove_prefix(1);
    }
    if (rest == "0")
        return std::chrono::nanoseconds{0};
    if (rest.empty())
        return std::unexpected(invalid(text, "empty"));

    std::uint64_t total = 0;
    while (!rest.empty()) {
        std::uint64_t whole       = 0;
        std::uint64_t fraction    = 0;
        std::uint64_t scale       = 1;
        bool          sawDigits   = false;

        while (!rest.empty() && isDigit(rest.front())) {
            if (whole > (kMaxNanos - 9) / 10)
                return std::unexpected(invalid(text, "overflow"));
            whole = whole * 10 + static_cast<std::uint64_t>(rest.front() - '0');
            sawDigits = true;
            rest.remove_prefix(1);
        }
        if (!rest.empty() && rest.front() == '.') {
            rest.remove_prefix(1);
            while (!rest.empty() && isDigit(rest.front())) {
                // Digits beyond nanosecond precision are dropped.
                if (scale < 1'000'000'000'000'000ULL) {
                    fraction = fraction * 10 + static_cast<std::uint64_t>(rest.front() - '0');
                    scale *= 10;
                }
                sawDigits = true;
                rest.remove_prefix(1);
            }
        }
        if (!sawDigits)
            return std::unexpected(invalid(text, "expected a number"));

        std::size_t unitLength = 0;
        while (unitLength < rest.size() && rest[unitLength] != '.' && !isDigit(rest[unitLength]))
            ++unitLength;
        if (unitLength == 0)
            return std::unexpected(invalid(text, "missing unit"));
        auto unitName = rest.substr(0, unitLength);
        rest.remove_prefix(unitLength);

        std::uint64_t unit = 0;
        for (auto const& candidate : kUnits) {
            if (candidate.name == unitName) {
                unit = candidate.nanos;
                break;
            }
        }
        if (unit == 0)
            return std::unexpected(invalid(text, "unknown unit '" + std::string(unitName) + "'"));

        if (whole > kMaxNanos / unit)
            return std::unexpected(invalid(text, "overflow"));
        auto component = whole * unit;
        if (fraction > 0) {
            auto fractional = static_cast<std::uint64_t>(static_cast<long double>(fraction) * static_cast<long double>(unit)
                                                         / static_cast<long double>(scale));
            if (component > kMaxNanos - fractional)
                return std::unexpected(invalid(text, "overflow"));
            component += fractional;
        }
        if (total > kMaxNanos - component)
            return std::unexpected(invalid(text, "overflow"));
        total += component;
    }

    auto signedTotal = static_cast<std::int64_t>(total);
    return std::chrono::nanoseconds{negative ? -signedTotal : signedTotal};
}

auto formatDuration(std::chrono::nanoseconds duration) -> std::string {
    auto count = duration.count();
    if (count == 0)
        return "0s";

    std::string   out;
    std::uint64_t u = 0;
    if (count < 0) {
        out.push_back('-');
        u = static_cast<std::uint64_t>(-(count + 1)) + 1;
    } else {
        u = static_cast<std::uint64_t>(count);
    }

    if (u < 1'000'000'000ULL) {
        if (u < 1'000ULL) {
            out += std::to_string(u);
            out += "ns";
        } else if (u < 1'000'000ULL) {
            appendFraction(out, u / 1'000ULL, u % 1'000ULL, 3);
            out += "\xC2\xB5s";
        } else {
            appendFraction(out, u / 1'000'000ULL, u % 1'000'000ULL, 6);
            out += "ms";
        }
        return out;
    }

    auto hours   = u / 3'600'000'000'000ULL;
    u           %= 3'600'000'000'000ULL;
    auto minutes = u / 60'000'000'000ULL;
    u           %= 60'000'000'000ULL;

    if (hours > 0) {
        out += std::to_string(hours);
        out.push_back('h');
    }
    if (hours > 0 || minutes > 0) {
        out += std::to_string(minutes);
        out.push_back('m');
    }
    appendFraction(out, u / 1'000'000'000ULL, u % 1'000'000'000ULL, 9);
    out.push_back('s');
    return out;
}

} // namespace MS::Utils
