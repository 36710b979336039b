#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace scriptbox {

struct SweepReport {
    size_t scanned{0};  // directories examined
    size_t removed{0};
    size_t failed{0};
    std::vector<std::string> errors;
};

// Delete every directory directly under `root` whose last-modified time is
// older than now - max_age. Plain files are left alone. A missing root is an
// empty sweep. Per-directory failures are logged and counted, never fatal.
SweepReport sweep_outputs(const std::filesystem::path& root, std::chrono::seconds max_age);

// Runs sweep_outputs once at start() and then every `interval` on a
// background thread until stop() (or destruction).
class RetentionSweeper {
public:
    RetentionSweeper(std::filesystem::path root, std::chrono::seconds max_age,
                     std::chrono::seconds interval);
    ~RetentionSweeper();

    RetentionSweeper(const RetentionSweeper&) = delete;
    RetentionSweeper& operator=(const RetentionSweeper&) = delete;

    void start();
    void stop();

    size_t sweeps_completed() const;

private:
    void loop();

    std::filesystem::path root_;
    std::chrono::seconds max_age_;
    std::chrono::seconds interval_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool stopping_{false};
    size_t sweeps_{0};
    std::thread th_;
};

} // namespace scriptbox
