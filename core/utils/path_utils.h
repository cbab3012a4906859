#ifndef FSMON_PATH_UTILS_H
#define FSMON_PATH_UTILS_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fsmon {
namespace core {

/**
 * @brief Path helpers shared by the pattern matcher, registry and watchers
 *
 * All paths handed between modules are absolute, lexically normalised and
 * use '/' separators without a trailing slash (except a root: "/" or a
 * drive root such as "C:/").
 */
class PathUtils {
public:
    /**
     * @brief Lexically normalise an absolute path
     */
    static std::string normalize(const std::string& path);

    /**
     * @brief Expand a leading "~" to $HOME
     */
    static std::string expand_home(const std::string& path);

    /**
     * @brief Resolve a path against a base directory (working directory when empty)
     */
    static std::string resolve(const std::string& path, const std::string& base);

    /**
     * @brief Walk up from start looking for a directory containing ".git"
     */
    static std::optional<std::string> find_git_root(const std::string& start);

    /**
     * @brief Default project root: git root of the working directory, else the working directory
     */
    static std::string default_project_root();

    /**
     * @brief Length of the root prefix: 1 for "/", 3 for "C:/", 2 for a bare "C:", else 0
     */
    static size_t root_length(const std::string& path);

    /**
     * @brief Rooted at "/" or at a drive root, on every host
     */
    static bool is_absolute(const std::string& path);

    static std::string parent(const std::string& path);
    static std::string filename(const std::string& path);
    static std::string join(const std::string& dir, const std::string& name);

    /**
     * @brief true when path equals dir or lies beneath it
     */
    static bool is_within(const std::string& path, const std::string& dir);

    /**
     * @brief Split into non-empty segments ("/a/b" -> {"a", "b"}, "C:/a" -> {"C:", "a"})
     */
    static std::vector<std::string> split(const std::string& path);
};

} // namespace core
} // namespace fsmon

#endif // FSMON_PATH_UTILS_H
