#ifndef FSMON_PATH_FILTER_H
#define FSMON_PATH_FILTER_H

#include "path_pattern.h"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fsmon {

/**
 * @brief Options controlling which paths the monitor never reports
 */
struct FilterOptions {
    std::string project_root;
    std::vector<std::string> ignore_patterns;
    bool use_gitignore{true};
    bool ignore_log_files{true};
};

/**
 * @brief PathFilter - ignore rules applied before listener matching
 *
 * Rules are evaluated in order and the last matching rule wins, so a
 * negated .gitignore entry ("!keep.log") re-includes a path an earlier
 * rule excluded. A rule that matches a directory also covers everything
 * beneath it.
 */
class PathFilter {
public:
    explicit PathFilter(const FilterOptions& options);

    /**
     * @brief true when events for path must be dropped
     */
    bool should_ignore(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Load rules from one .gitignore file
     *
     * Patterns are relative to the directory holding the file.
     */
    bool add_gitignore_file(const std::string& gitignore_path);

    /**
     * @brief Add one rule relative to the project root
     */
    bool add_pattern(const std::string& pattern);

    size_t rule_count() const;

    /**
     * @brief Log files and log directories never produce events
     */
    static bool is_log_file(const std::string& path);

private:
    struct Rule {
        PathPattern pattern;
        bool negated;
        bool directory_only;
        std::string base_dir;
    };

    bool add_rule(const std::string& raw, const std::string& base_dir);
    void load_gitignore_tree(const std::string& root);
    bool rule_matches(const Rule& rule, const std::string& path, bool is_directory) const;

    FilterOptions options_;
    std::vector<Rule> rules_;

    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, bool> cache_;
};

} // namespace fsmon

#endif // FSMON_PATH_FILTER_H
