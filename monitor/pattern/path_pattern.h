#ifndef FSMON_PATH_PATTERN_H
#define FSMON_PATH_PATTERN_H

#include "core/include/Result.h"
#include <string>
#include <vector>

namespace fsmon {

/**
 * @brief A directory the pattern needs watched, plus how deep below it
 *
 * depth 0 watches the directory alone, depth n also watches n levels of
 * subdirectories, kUnlimited watches the whole subtree including
 * subdirectories created later.
 */
struct WatchRoot {
    static constexpr int kUnlimited = -1;

    std::string path;
    int depth{0};

    bool recursive() const { return depth == kUnlimited; }

    bool operator==(const WatchRoot& other) const {
        return path == other.path && depth == other.depth;
    }
};

/**
 * @brief PathPattern - compiled Unix glob over absolute paths
 *
 * Supported wildcards:
 * - '*'  any run of characters inside one path segment
 * - '?'  exactly one character other than '/'
 * - '**' as a whole segment, zero or more segments
 *
 * Relative patterns are resolved against the project root, "~" expands to
 * $HOME, absolute patterns pass through. A pattern without wildcards names
 * a single explicit file or directory.
 */
class PathPattern {
public:
    /**
     * @brief Compile a pattern
     *
     * @param pattern Glob as written by the caller
     * @param root Directory relative patterns resolve against; empty uses the
     *             git root of the working directory
     * @return Compiled pattern or ErrorCode::InvalidPattern
     */
    static Result<PathPattern> compile(const std::string& pattern, const std::string& root = "");

    /**
     * @brief Check an absolute, normalised path against the pattern
     */
    bool matches(const std::string& path) const;

    /**
     * @brief Can any path strictly below dir match?
     *
     * Used to decide whether dir must be watched and whether a newly created
     * subdirectory needs a watch of its own.
     */
    bool may_match_under(const std::string& dir) const;

    /**
     * @brief Fixed-prefix directories that must be watched
     */
    const std::vector<WatchRoot>& minimal_dirs() const { return roots_; }

    bool is_explicit() const { return !has_wildcards_; }
    bool is_recursive() const { return recursive_; }

    const std::string& pattern() const { return original_; }
    const std::string& resolved() const { return resolved_; }

    /**
     * @brief Match one segment against a glob segment ('*' and '?')
     */
    static bool match_segment(const std::string& glob, const std::string& name);

private:
    PathPattern() = default;

    static bool has_wildcard(const std::string& segment);

    std::string original_;
    std::string resolved_;
    std::vector<std::string> segments_;
    std::vector<WatchRoot> roots_;
    bool has_wildcards_{false};
    bool recursive_{false};
};

} // namespace fsmon

#endif // FSMON_PATH_PATTERN_H
