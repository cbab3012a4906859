#include "path_filter.h"
#include "core/utils/path_utils.h"
#include "core/logger/logger.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;

namespace fsmon {

using core::PathUtils;

namespace {

constexpr size_t kMaxCachedResults = 10000;

}

PathFilter::PathFilter(const FilterOptions& options)
    : options_(options) {
    if (options_.project_root.empty()) {
        options_.project_root = PathUtils::default_project_root();
    }
    options_.project_root = PathUtils::normalize(options_.project_root);

    // Mandatory rules
    add_rule(".git/", options_.project_root);
    add_rule("scratchpad/", options_.project_root);
    add_rule("*deprecated*", options_.project_root);

    for (const auto& pattern : options_.ignore_patterns) {
        if (!add_rule(pattern, options_.project_root)) {
            FSMON_LOG_WARN("PathFilter", "Ignoring invalid pattern from configuration: '" + pattern + "'");
        }
    }

    if (options_.use_gitignore) {
        load_gitignore_tree(options_.project_root);
    }

    FSMON_LOG_INFO("PathFilter", "Initialized with " + std::to_string(rules_.size()) + " ignore rules");
}

bool PathFilter::should_ignore(const std::string& path, bool is_directory) const {
    std::string normalized = PathUtils::normalize(path);

    std::lock_guard<std::mutex> lock(mutex_);
    std::string cache_key = normalized + (is_directory ? "/" : "");
    auto cached = cache_.find(cache_key);
    if (cached != cache_.end()) {
        return cached->second;
    }

    bool ignored = false;
    if (options_.ignore_log_files && is_log_file(normalized)) {
        ignored = true;
    } else {
        for (const auto& rule : rules_) {
            if (rule_matches(rule, normalized, is_directory)) {
                ignored = !rule.negated;
            }
        }
    }

    if (cache_.size() >= kMaxCachedResults) {
        cache_.clear();
    }
    cache_[cache_key] = ignored;
    return ignored;
}

bool PathFilter::add_gitignore_file(const std::string& gitignore_path) {
    std::ifstream file(gitignore_path);
    if (!file.is_open()) {
        FSMON_LOG_WARN("PathFilter", ".gitignore not readable: " + gitignore_path);
        return false;
    }

    std::string base_dir = PathUtils::parent(PathUtils::normalize(gitignore_path));
    size_t count = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }
        auto end = line.find_last_not_of(" \t");
        if (add_rule(line.substr(start, end - start + 1), base_dir)) {
            ++count;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    FSMON_LOG_DEBUG("PathFilter", "Added " + std::to_string(count) + " rules from " + gitignore_path);
    return true;
}

bool PathFilter::add_pattern(const std::string& pattern) {
    bool added = add_rule(pattern, options_.project_root);
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    return added;
}

size_t PathFilter::rule_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

bool PathFilter::is_log_file(const std::string& path) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\.log$)"),
        std::regex(R"(/logs?/)"),
        std::regex(R"(\.log\.\d+$)"),      // app.log.1, app.log.20250429
        std::regex(R"(\.log\.\w+$)"),      // app.log.bak, app.log.old
    };

    for (const auto& pattern : patterns) {
        if (std::regex_search(path, pattern)) {
            return true;
        }
    }
    return false;
}

bool PathFilter::add_rule(const std::string& raw, const std::string& base_dir) {
    std::string pattern = raw;
    bool negated = false;
    if (!pattern.empty() && pattern[0] == '!') {
        negated = true;
        pattern = pattern.substr(1);
    }

    bool directory_only = false;
    while (!pattern.empty() && pattern.back() == '/') {
        directory_only = true;
        pattern.pop_back();
    }
    if (pattern.empty()) {
        return false;
    }

    // A pattern without an inner '/' matches at any depth below its base
    bool anchored = pattern.find('/') != std::string::npos;
    if (!anchored) {
        pattern = "**/" + pattern;
    } else if (pattern[0] == '/') {
        pattern = pattern.substr(1);
    }

    auto compiled = PathPattern::compile(pattern, base_dir);
    if (!compiled) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rules_.push_back(Rule{std::move(compiled.value()), negated, directory_only, base_dir});
    return true;
}

void PathFilter::load_gitignore_tree(const std::string& root) {
    std::vector<std::string> files;
    std::error_code ec;

    if (fs::is_regular_file(fs::path(root) / ".gitignore", ec)) {
        files.push_back(PathUtils::join(root, ".gitignore"));
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code type_ec;
        bool is_dir = entry.is_directory(type_ec) && !entry.is_symlink(type_ec);

        if (is_dir && (name == ".git" || should_ignore(entry.path().string(), true))) {
            it.disable_recursion_pending();
        } else if (is_dir) {
            fs::path candidate = entry.path() / ".gitignore";
            if (fs::is_regular_file(candidate, type_ec)) {
                files.push_back(PathUtils::normalize(candidate.string()));
            }
        }
        it.increment(ec);
    }
    if (ec) {
        FSMON_LOG_WARN("PathFilter", "Stopped scanning for .gitignore files: " + ec.message());
    }

    // Shallow files first so deeper rules take precedence
    std::sort(files.begin(), files.end(), [](const std::string& a, const std::string& b) {
        return std::count(a.begin(), a.end(), '/') < std::count(b.begin(), b.end(), '/');
    });

    for (const auto& file : files) {
        add_gitignore_file(file);
    }
    FSMON_LOG_DEBUG("PathFilter", "Loaded " + std::to_string(files.size()) + " .gitignore files");
}

bool PathFilter::rule_matches(const Rule& rule, const std::string& path, bool is_directory) const {
    if (!PathUtils::is_within(path, rule.base_dir) || path == rule.base_dir) {
        return false;
    }

    if (rule.pattern.matches(path) && (!rule.directory_only || is_directory)) {
        return true;
    }

    // Any ancestor below the base matching also covers path
    std::string ancestor = PathUtils::parent(path);
    while (ancestor != rule.base_dir && PathUtils::is_within(ancestor, rule.base_dir)) {
        if (rule.pattern.matches(ancestor)) {
            return true;
        }
        ancestor = PathUtils::parent(ancestor);
    }
    return false;
}

} // namespace fsmon
