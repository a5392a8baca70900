#include "fidx/walk.h"

#include <system_error>

namespace fs = std::filesystem;

namespace fidx::walk {

void PathCollector::visit_file(const fs::directory_entry& entry) {
    paths_.insert(entry.path().string());
}

Deadline deadline_after(std::optional<uint64_t> seconds) {
    if (!seconds) return std::nullopt;
    auto now = Clock::now();
    // Durations past the clock's range mean "never".
    auto max_secs = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now).count();
    if (*seconds >= static_cast<uint64_t>(max_secs)) return Clock::time_point::max();
    return now + std::chrono::seconds(static_cast<std::chrono::seconds::rep>(*seconds));
}

static bool deadline_passed(const Deadline& deadline) {
    return deadline && Clock::now() >= *deadline;
}

static WalkResult failed(const fs::path& dir, const std::error_code& ec) {
    WalkResult r;
    r.status = WalkStatus::Failed;
    r.error = "cannot read directory " + dir.string() + ": " + ec.message();
    r.failed_dir = dir;
    return r;
}

WalkResult walk(const fs::path& dir, FileVisitor& visitor,
                const Deadline& deadline, const WarningFunc& warn) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return failed(dir, ec);

    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (deadline_passed(deadline))
            return {WalkStatus::TimedOut, {}, {}};

        const auto& entry = *it;
        auto st = entry.symlink_status(ec);
        if (ec) {
            if (warn) warn(entry.path(), ec.message());
            ec.clear();
            continue;
        }

        if (fs::is_symlink(st)) {
            continue;
        } else if (fs::is_directory(st)) {
            // Keep going with the siblings once the subtree is done.
            auto sub = walk(entry.path(), visitor, deadline, warn);
            if (sub.status != WalkStatus::Completed) return sub;
        } else if (fs::is_regular_file(st)) {
            visitor.visit_file(entry);
        }
        // sockets, fifos, devices: skipped
    }
    if (ec) return failed(dir, ec);

    return {};
}

} // namespace fidx::walk
