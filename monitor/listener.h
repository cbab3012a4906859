#ifndef FSMON_LISTENER_H
#define FSMON_LISTENER_H

#include <chrono>
#include <optional>
#include <string>

namespace fsmon {

/**
 * @brief IFileSystemListener - what a caller wants to hear about
 *
 * A listener names a glob pattern, an optional extra filter, a debounce
 * delay and eight callbacks. Callbacks run on the monitor's delivery
 * thread; an exception thrown from one is logged and does not affect
 * other listeners.
 *
 * The monitor reads path_pattern(), debounce_delay() once at registration;
 * later changes to their return values are ignored.
 */
class IFileSystemListener {
public:
    virtual ~IFileSystemListener() = default;

    /**
     * @brief Glob pattern ('*', '?', '**'), absolute or relative to the project root
     */
    virtual std::string path_pattern() const = 0;

    /**
     * @brief Extra predicate applied after the pattern matched
     */
    virtual bool filter(const std::string& path) const {
        (void)path;
        return true;
    }

    /**
     * @brief Debounce delay; nullopt uses fs_monitor.default_debounce_ms
     */
    virtual std::optional<std::chrono::milliseconds> debounce_delay() const {
        return std::nullopt;
    }

    virtual void on_file_created(const std::string& path) = 0;
    virtual void on_file_modified(const std::string& path) = 0;
    virtual void on_file_deleted(const std::string& path) = 0;
    virtual void on_directory_created(const std::string& path) = 0;
    virtual void on_directory_deleted(const std::string& path) = 0;
    virtual void on_symlink_created(const std::string& path, const std::string& target) = 0;
    virtual void on_symlink_deleted(const std::string& path) = 0;
    virtual void on_symlink_target_changed(const std::string& path,
                                           const std::string& old_target,
                                           const std::string& new_target) = 0;
};

/**
 * @brief Listener with no-op callbacks; override what you need
 */
class BaseFileSystemListener : public IFileSystemListener {
public:
    explicit BaseFileSystemListener(std::string pattern,
                                    std::optional<std::chrono::milliseconds> debounce = std::nullopt)
        : pattern_(std::move(pattern))
        , debounce_(debounce) {}

    std::string path_pattern() const override { return pattern_; }
    std::optional<std::chrono::milliseconds> debounce_delay() const override { return debounce_; }

    void on_file_created(const std::string&) override {}
    void on_file_modified(const std::string&) override {}
    void on_file_deleted(const std::string&) override {}
    void on_directory_created(const std::string&) override {}
    void on_directory_deleted(const std::string&) override {}
    void on_symlink_created(const std::string&, const std::string&) override {}
    void on_symlink_deleted(const std::string&) override {}
    void on_symlink_target_changed(const std::string&, const std::string&, const std::string&) override {}

private:
    std::string pattern_;
    std::optional<std::chrono::milliseconds> debounce_;
};

} // namespace fsmon

#endif // FSMON_LISTENER_H
