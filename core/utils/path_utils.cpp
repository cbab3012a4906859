#include "path_utils.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace fsmon {
namespace core {

std::string PathUtils::normalize(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    std::string result = fs::path(path).lexically_normal().generic_string();
    const size_t keep = std::max<size_t>(root_length(result), 1);
    while (result.size() > keep && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::string PathUtils::expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user is not expanded
        return path;
    }

    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

std::string PathUtils::resolve(const std::string& path, const std::string& base) {
    std::string expanded = expand_home(path);
    fs::path p(expanded);
    if (is_absolute(expanded) || p.is_absolute()) {
        return normalize(expanded);
    }
    std::error_code ec;
    fs::path base_dir = base.empty() ? fs::current_path(ec) : fs::path(base);
    return normalize((base_dir / p).generic_string());
}

std::optional<std::string> PathUtils::find_git_root(const std::string& start) {
    std::error_code ec;
    fs::path current = fs::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }

    while (true) {
        if (fs::exists(current / ".git", ec)) {
            return normalize(current.string());
        }
        fs::path parent_path = current.parent_path();
        if (parent_path == current || parent_path.empty()) {
            break;
        }
        current = parent_path;
    }
    return std::nullopt;
}

std::string PathUtils::default_project_root() {
    std::error_code ec;
    std::string cwd = fs::current_path(ec).string();
    if (ec) {
        return "/";
    }
    auto git_root = find_git_root(cwd);
    return git_root ? *git_root : normalize(cwd);
}

size_t PathUtils::root_length(const std::string& path) {
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') {
        return path.size() >= 3 && path[2] == '/' ? 3 : 2;
    }
    return !path.empty() && path[0] == '/' ? 1 : 0;
}

bool PathUtils::is_absolute(const std::string& path) {
    size_t root = root_length(path);
    return root == 1 || root == 3;
}

std::string PathUtils::parent(const std::string& path) {
    const size_t root = root_length(path);
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return root == 2 ? path : ".";
    }
    if (pos < root) {
        // The parent of a root is the root itself
        return path.substr(0, root);
    }
    return path.substr(0, pos);
}

std::string PathUtils::filename(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string PathUtils::join(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

bool PathUtils::is_within(const std::string& path, const std::string& dir) {
    if (path == dir) {
        return true;
    }
    if (!dir.empty() && dir.back() == '/') {
        // "/" or a drive root such as "C:/"
        return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0;
    }
    return path.size() > dir.size() &&
           path.compare(0, dir.size(), dir) == 0 &&
           path[dir.size()] == '/';
}

std::vector<std::string> PathUtils::split(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

} // namespace core
} // namespace fsmon
