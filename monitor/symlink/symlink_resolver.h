#ifndef FSMON_SYMLINK_RESOLVER_H
#define FSMON_SYMLINK_RESOLVER_H

#include "core/include/Result.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fsmon {

/**
 * @brief A resolved symbolic link
 *
 * target is the link text as stored on disk; final_target is the absolute
 * path at the end of the chain.
 */
struct SymlinkRecord {
    std::string path;
    std::string target;
    std::string final_target;
    int resolution_depth{0};
};

struct TargetChange {
    std::string old_target;
    std::string new_target;
};

/**
 * @brief SymlinkResolver - link resolution, target tracking, cycle detection
 *
 * Thread-safe; shared by the dispatcher thread and registering callers.
 */
class SymlinkResolver {
public:
    explicit SymlinkResolver(int max_depth = 10);

    /**
     * @brief Follow the chain starting at path
     *
     * @return FileNotFound, NotASymlink, or CircularSymlink when the chain
     *         revisits a link or is longer than max_depth hops
     */
    Result<SymlinkRecord> resolve(const std::string& path) const;

    /**
     * @brief Resolve and remember path
     *
     * A circular link is excluded until its link text changes.
     */
    Result<SymlinkRecord> track(const std::string& path);

    void forget(const std::string& path);

    /**
     * @brief Re-read a tracked or excluded link
     *
     * @return Old and new link text when the link now points elsewhere
     */
    std::optional<TargetChange> check_target_change(const std::string& path);

    /**
     * @brief Last known record, kept after the link is deleted
     */
    std::optional<SymlinkRecord> record(const std::string& path) const;

    bool is_tracked(const std::string& path) const;

    /**
     * @brief true while path is excluded as circular and its link text is unchanged
     */
    bool is_excluded(const std::string& path);

    size_t tracked_count() const;
    int max_depth() const { return max_depth_; }

    /**
     * @brief Raw link text, empty when path is not a readable link
     */
    static std::string read_link(const std::string& path);

private:
    int max_depth_;

    mutable std::mutex mutex_;
    std::map<std::string, SymlinkRecord> records_;
    std::map<std::string, std::string> excluded_;   // path -> link text at exclusion
};

} // namespace fsmon

#endif // FSMON_SYMLINK_RESOLVER_H
