#include "path_pattern.h"
#include "core/utils/path_utils.h"
#include "core/logger/logger.h"

namespace fsmon {

using core::PathUtils;

Result<PathPattern> PathPattern::compile(const std::string& pattern, const std::string& root) {
    if (pattern.empty()) {
        return Err<PathPattern>(ErrorCode::InvalidPattern, "Pattern cannot be empty");
    }
    if (pattern.find('\0') != std::string::npos) {
        return Err<PathPattern>(ErrorCode::InvalidPattern, "Pattern contains a NUL character");
    }

    std::string base = root.empty() ? PathUtils::default_project_root() : root;

    PathPattern compiled;
    compiled.original_ = pattern;
    compiled.resolved_ = PathUtils::resolve(pattern, base);
    if (!PathUtils::is_absolute(compiled.resolved_)) {
        return Err<PathPattern>(ErrorCode::InvalidPattern,
                                "Pattern does not resolve to an absolute path: " + pattern);
    }

    compiled.segments_ = PathUtils::split(compiled.resolved_);

    for (const auto& segment : compiled.segments_) {
        if (segment.find("**") != std::string::npos && segment != "**") {
            return Err<PathPattern>(ErrorCode::InvalidPattern,
                                    "'**' must be a whole path segment in pattern: " + pattern);
        }
        if (segment == "**") {
            compiled.recursive_ = true;
        }
        if (has_wildcard(segment)) {
            compiled.has_wildcards_ = true;
        }
    }

    // Fixed prefix: segments before the first wildcard segment
    size_t first_wild = compiled.segments_.size();
    for (size_t i = 0; i < compiled.segments_.size(); ++i) {
        if (has_wildcard(compiled.segments_[i])) {
            first_wild = i;
            break;
        }
    }

    WatchRoot watch_root;
    if (!compiled.has_wildcards_) {
        // Explicit path: watch the directory holding it
        watch_root.path = PathUtils::parent(compiled.resolved_);
        watch_root.depth = 0;
    } else {
        // Root is "/" or a drive root; a drive is the first fixed segment
        const size_t root = PathUtils::root_length(compiled.resolved_);
        std::string prefix = compiled.resolved_.substr(0, root);
        for (size_t i = (root == 1 ? 0 : 1); i < first_wild; ++i) {
            prefix = PathUtils::join(prefix, compiled.segments_[i]);
        }
        watch_root.path = prefix;
        if (compiled.recursive_) {
            watch_root.depth = WatchRoot::kUnlimited;
        } else {
            // Directory segments after the prefix each add one level
            watch_root.depth = static_cast<int>(compiled.segments_.size() - first_wild) - 1;
        }
    }
    compiled.roots_.push_back(watch_root);

    FSMON_LOG_DEBUG("PathPattern", "Compiled '" + pattern + "' -> " + compiled.resolved_ +
                    " (root " + watch_root.path + ", depth " + std::to_string(watch_root.depth) + ")");

    return compiled;
}

bool PathPattern::matches(const std::string& path) const {
    if (!has_wildcards_) {
        return PathUtils::normalize(path) == resolved_;
    }

    const std::vector<std::string> names = PathUtils::split(path);
    const size_t p_count = segments_.size();
    const size_t n_count = names.size();

    // reach[j] == true: pattern segments [0, i) consumed path segments [0, j)
    std::vector<char> reach(n_count + 1, 0);
    reach[0] = 1;

    for (size_t i = 0; i < p_count; ++i) {
        std::vector<char> next(n_count + 1, 0);
        const std::string& seg = segments_[i];

        if (seg == "**") {
            bool any = false;
            for (size_t j = 0; j <= n_count; ++j) {
                any = any || reach[j];
                next[j] = any ? 1 : 0;
            }
        } else {
            for (size_t j = 0; j < n_count; ++j) {
                if (reach[j] && match_segment(seg, names[j])) {
                    next[j + 1] = 1;
                }
            }
        }
        reach.swap(next);
    }

    return reach[n_count] != 0;
}

bool PathPattern::may_match_under(const std::string& dir) const {
    const std::vector<std::string> names = PathUtils::split(dir);
    const size_t p_count = segments_.size();

    // states: pattern positions reachable after consuming every segment of dir
    std::vector<char> states(p_count + 1, 0);
    states[0] = 1;

    // epsilon closure over '**' so "a/**/b" also matches "a/b"
    auto close_over_globstar = [this, p_count](std::vector<char>& s) {
        for (size_t i = 0; i < p_count; ++i) {
            if (s[i] && segments_[i] == "**") {
                s[i + 1] = 1;
            }
        }
    };
    close_over_globstar(states);

    for (const auto& name : names) {
        std::vector<char> next(p_count + 1, 0);
        for (size_t i = 0; i < p_count; ++i) {
            if (!states[i]) {
                continue;
            }
            if (segments_[i] == "**") {
                next[i] = 1;
            } else if (match_segment(segments_[i], name)) {
                next[i + 1] = 1;
            }
        }
        states.swap(next);
        close_over_globstar(states);
    }

    for (size_t i = 0; i < p_count; ++i) {
        if (states[i]) {
            return true;
        }
    }
    return false;
}

bool PathPattern::match_segment(const std::string& glob, const std::string& name) {
    size_t g = 0;
    size_t n = 0;
    size_t star = std::string::npos;
    size_t star_n = 0;

    while (n < name.size()) {
        if (g < glob.size() && (glob[g] == '?' || glob[g] == name[n])) {
            ++g;
            ++n;
        } else if (g < glob.size() && glob[g] == '*') {
            star = g++;
            star_n = n;
        } else if (star != std::string::npos) {
            g = star + 1;
            n = ++star_n;
        } else {
            return false;
        }
    }

    while (g < glob.size() && glob[g] == '*') {
        ++g;
    }
    return g == glob.size();
}

bool PathPattern::has_wildcard(const std::string& segment) {
    return segment.find_first_of("*?") != std::string::npos;
}

} // namespace fsmon
