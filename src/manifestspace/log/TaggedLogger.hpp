#pragma once

// Tags shared by call sites. Per-operation index tags are skipped by default.
namespace MS::LogTag {
inline constexpr char const* Maintenance = "Maintenance";
inline constexpr char const* Memory      = "MemoryIndex";
inline constexpr char const* Directory   = "DirectoryIndex";
inline constexpr char const* Storage     = "Storage";
inline constexpr char const* Cli         = "CLI";
inline constexpr char const* Test        = "TEST";
inline constexpr char const* Warning     = "WARNING";
inline constexpr char const* Failure     = "FAILURE";
} // namespace MS::LogTag

#ifdef MS_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace MS {

/**
 * Asynchronous tagged logger. Records are queued by the caller and written by a worker
 * thread, one line each:
 *
 *   12:04:05.123 Maintenance,WARNING (Main) maintenance/MaintenanceParams.cpp:42 message
 *
 * A record carrying any skipped tag is dropped. Output goes to std::cerr unless a sink
 * is set; writes to the sink happen under coutMutex.
 */
class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point timestamp;
        std::vector<std::string>              tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log(std::string message, std::source_location const& location, Tags&&... tags) -> void;

    auto setThreadName(std::string const& name) -> void;
    auto setEnabled(bool enabled) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;
    // nullptr restores std::cerr.
    auto setSink(std::ostream* sink) -> void;

    // MANIFESTSPACE_LOG (anything but "0") enables output; MANIFESTSPACE_LOG_SKIP is a
    // comma separated list replacing the skipped tags.
    auto configureFromEnvironment() -> void;

    // Blocks until every queued record has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    auto enqueue(Record record) -> void;
    auto run() -> void;
    auto write(Record const& record) -> void;
    auto threadName(std::thread::id id) -> std::string;

    std::queue<Record>      queue;
    std::size_t             inFlight = 0;
    std::mutex              queueMutex;
    std::condition_variable wake;
    std::condition_variable drained;
    bool                    stopping = false;
    std::atomic<bool>       enabled{false};

    std::set<std::string> skipTags{LogTag::Memory, LogTag::Directory};
    std::ostream*         sink = nullptr;
    std::mutex            settingsMutex;

    std::unordered_map<std::thread::id, std::string> threadNames;
    std::mutex                                       threadNamesMutex;
    int                                              nextThreadNumber = 0;

    std::thread worker;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log(std::string message, std::source_location const& location, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;
    this->enqueue(Record{.timestamp  = std::chrono::system_clock::now(),
                         .tags       = {std::string(std::forward<Tags>(tags))...},
                         .message    = std::move(message),
                         .threadName = this->threadName(std::this_thread::get_id()),
                         .location   = location});
}

#define ms_log(message, ...) ::MS::logger().log(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(std::string const& name);
void set_logging_enabled(bool enabled);

} // namespace MS

#else
#define ms_log(message, ...) ((void)0)
#endif // MS_LOG_DEBUG
