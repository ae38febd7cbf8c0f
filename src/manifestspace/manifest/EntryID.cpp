#include "manifest/EntryID.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace MS::Manifest {

auto generateEntryID(std::chrono::system_clock::time_point now) -> EntryID {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    if (millis < 0)
        millis = 0;

    thread_local std::mt19937_64                 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    auto                                         high = dist(engine) & 0xFFFFFULL; // 5 hex digits
    auto                                         low  = dist(engine) & 0xFFFFFFFFFFFFFFFULL; // 15 hex digits

    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0')
        << std::setw(kEntryIDTimeDigits) << (static_cast<std::uint64_t>(millis) & 0xFFFFFFFFFFFFULL)
        << std::setw(5) << high
        << std::setw(15) << low;
    return oss.str();
}

auto isValidEntryID(std::string_view id) -> bool {
    if (id.size() != kEntryIDLength)
        return false;
    for (char ch : id) {
        bool digit = ch >= '0' && ch <= '9';
        bool hex   = ch >= 'a' && ch <= 'f';
        if (!digit && !hex)
            return false;
    }
    return true;
}

} // namespace MS::Manifest
