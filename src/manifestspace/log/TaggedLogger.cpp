#ifdef MS_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace MS {
namespace {

// "src/manifestspace/manifest/X.cpp" -> "manifest/X.cpp"
auto shortPath(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

auto splitTags(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto tag   = text.substr(0, comma);
        if (!tag.empty())
            tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : worker(&TaggedLogger::run, this) {}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->stopping = true;
    }
    this->wake.notify_one();
    if (this->worker.joinable())
        this->worker.join();
}

auto TaggedLogger::setThreadName(std::string const& name) -> void {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    this->threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setEnabled(bool value) -> void {
    this->enabled.store(value, std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->settingsMutex);
    this->skipTags = std::move(tags);
}

auto TaggedLogger::setSink(std::ostream* value) -> void {
    std::lock_guard<std::mutex> lock(this->settingsMutex);
    this->sink = value;
}

auto TaggedLogger::configureFromEnvironment() -> void {
    if (char const* flag = std::getenv("MANIFESTSPACE_LOG"))
        this->setEnabled(std::strcmp(flag, "0") != 0);
    if (char const* skip = std::getenv("MANIFESTSPACE_LOG_SKIP"))
        this->setSkipTags(splitTags(skip));
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->queue.empty() && this->inFlight == 0; });
}

auto TaggedLogger::enqueue(Record record) -> void {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->queue.push(std::move(record));
    }
    this->wake.notify_one();
}

auto TaggedLogger::run() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->wake.wait(lock, [this] { return !this->queue.empty() || this->stopping; });
        if (this->queue.empty() && this->stopping)
            return;

        auto record = std::move(this->queue.front());
        this->queue.pop();
        ++this->inFlight;
        lock.unlock();
        this->write(record);
        lock.lock();
        --this->inFlight;
        if (this->queue.empty())
            this->drained.notify_all();
    }
}

auto TaggedLogger::write(Record const& record) -> void {
    std::ostream* out = nullptr;
    {
        std::lock_guard<std::mutex> lock(this->settingsMutex);
        for (auto const& tag : record.tags) {
            if (this->skipTags.contains(tag))
                return;
        }
        out = this->sink;
    }

    auto const time   = std::chrono::system_clock::to_time_t(record.timestamp);
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (std::size_t i = 0; i < record.tags.size(); ++i)
        line << (i == 0 ? "" : ",") << record.tags[i];
    line << " (" << record.threadName << ") " << shortPath(record.location.file_name()) << ':' << record.location.line()
         << ' ' << record.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    (out ? *out : std::cerr) << line.str() << std::flush;
}

auto TaggedLogger::threadName(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(this->nextThreadNumber++);
    return it->second;
}

void set_thread_name(std::string const& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setEnabled(enabled);
}

} // namespace MS
#endif // MS_LOG_DEBUG
