#include "scriptbox/sweeper.h"
#include "scriptbox/audit_log.h"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace scriptbox {

SweepReport sweep_outputs(const fs::path& root, std::chrono::seconds max_age) {
    SweepReport rep;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return rep;

    // Keeps now - max_age inside the file clock's range; nothing on disk is
    // a century old.
    const std::chrono::seconds longest = std::chrono::hours(24 * 365 * 100);
    if (max_age > longest) max_age = longest;
    if (max_age.count() < 0) max_age = std::chrono::seconds(0);
    const auto cutoff = fs::file_time_type::clock::now() - max_age;

    // Collect first: removing while iterating invalidates the iterator.
    std::vector<fs::path> dirs;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code dec;
        if (it->is_directory(dec) && !dec && !it->is_symlink(dec)) dirs.push_back(it->path());
    }
    if (ec) {
        rep.failed++;
        rep.errors.push_back("cannot list " + root.string() + ": " + ec.message());
        std::cerr << "[sweeper][WARN] " << rep.errors.back() << "\n";
        return rep;
    }

    for (const auto& d : dirs) {
        rep.scanned++;
        std::error_code mec;
        auto mtime = fs::last_write_time(d, mec);
        if (mec) {
            // vanished between listing and stat: someone else removed it
            if (mec == std::errc::no_such_file_or_directory) continue;
            rep.failed++;
            rep.errors.push_back("stat " + d.string() + ": " + mec.message());
            std::cerr << "[sweeper][WARN] " << rep.errors.back() << "\n";
            continue;
        }
        if (mtime >= cutoff) continue;

        std::error_code rec;
        fs::remove_all(d, rec);
        if (rec) {
            rep.failed++;
            rep.errors.push_back("remove " + d.string() + ": " + rec.message());
            std::cerr << "[sweeper][WARN] " << rep.errors.back() << "\n";
            continue;
        }
        rep.removed++;
        std::cerr << "[sweeper] removed " << d.filename().string() << "\n";
    }

    audit_sweep(rep);
    return rep;
}

RetentionSweeper::RetentionSweeper(fs::path root, std::chrono::seconds max_age,
                                   std::chrono::seconds interval)
    : root_(std::move(root)), max_age_(max_age), interval_(interval) {
    if (interval_.count() <= 0) interval_ = std::chrono::seconds(600);
}

RetentionSweeper::~RetentionSweeper() {
    stop();
}

void RetentionSweeper::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (th_.joinable()) return;
    stopping_ = false;
    th_ = std::thread([this]() { loop(); });
}

void RetentionSweeper::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
}

size_t RetentionSweeper::sweeps_completed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sweeps_;
}

void RetentionSweeper::loop() {
    while (true) {
        SweepReport rep = sweep_outputs(root_, max_age_);
        if (rep.removed > 0 || rep.failed > 0) {
            std::cerr << "[sweeper] scanned=" << rep.scanned << " removed=" << rep.removed
                      << " failed=" << rep.failed << "\n";
        }
        std::unique_lock<std::mutex> lk(mu_);
        sweeps_++;
        if (cv_.wait_for(lk, interval_, [this]() { return stopping_; })) return;
    }
}

} // namespace scriptbox
