#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

namespace fidx::walk {

// FileVisitor is called once for every regular file a walk reaches.
class FileVisitor {
public:
    virtual ~FileVisitor() = default;
    virtual void visit_file(const std::filesystem::directory_entry& entry) = 0;
};

// PathCollector records the path of every visited file.
class PathCollector : public FileVisitor {
public:
    void visit_file(const std::filesystem::directory_entry& entry) override;

    const std::unordered_set<std::string>& paths() const { return paths_; }

private:
    std::unordered_set<std::string> paths_;
};

enum class WalkStatus { Completed, TimedOut, Failed };

// WalkResult describes how a walk ended. On Failed, error holds the cause and
// failed_dir the directory that could not be read.
struct WalkResult {
    WalkStatus status = WalkStatus::Completed;
    std::string error;
    std::filesystem::path failed_dir;
};

using Clock = std::chrono::system_clock;
using Deadline = std::optional<Clock::time_point>;

// WarningFunc receives entries that were skipped because they could not be stat'ed.
using WarningFunc = std::function<void(const std::filesystem::path&, const std::string&)>;

// deadline_after returns now + seconds, or no deadline. Durations beyond the
// clock's range give Clock::time_point::max().
Deadline deadline_after(std::optional<uint64_t> seconds);

// walk visits every regular file below dir, depth first. Subdirectories are
// recursed into, symlinks and special files are skipped. The deadline is
// checked before each directory entry; once reached the walk stops with
// TimedOut, keeping whatever the visitor already did.
WalkResult walk(const std::filesystem::path& dir, FileVisitor& visitor,
                const Deadline& deadline = std::nullopt, const WarningFunc& warn = nullptr);

} // namespace fidx::walk
