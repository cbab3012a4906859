#include "watcher_windows.h"
#include "core/logger/logger.h"

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef NOGDI
#define NOGDI
#endif
#include <windows.h>
#endif

namespace fsmon {
namespace watchers {

#ifdef _WIN32

namespace {

constexpr DWORD kNotifyFilter = FILE_NOTIFY_CHANGE_FILE_NAME | FILE_NOTIFY_CHANGE_DIR_NAME |
                                FILE_NOTIFY_CHANGE_LAST_WRITE | FILE_NOTIFY_CHANGE_SIZE |
                                FILE_NOTIFY_CHANGE_CREATION | FILE_NOTIFY_CHANGE_ATTRIBUTES;

std::wstring to_wide(const std::string& utf8) {
    if (utf8.empty()) return std::wstring();
    int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), &wide[0], len);
    return wide;
}

std::string to_utf8(const wchar_t* wide, size_t count) {
    if (count == 0) return std::string();
    int len = WideCharToMultiByte(CP_UTF8, 0, wide, static_cast<int>(count), nullptr, 0, nullptr, nullptr);
    std::string utf8(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, static_cast<int>(count), &utf8[0], len, nullptr, nullptr);
    return utf8;
}

}

WatcherWindows::WatcherWindows()
    : running_(false)
    , dir_handle_(INVALID_HANDLE_VALUE)
    , io_event_(nullptr)
    , stop_event_(nullptr)
    , overlapped_(nullptr) {
}

WatcherWindows::~WatcherWindows() {
    stop();
}

bool WatcherWindows::is_supported() {
    return true;
}

bool WatcherWindows::start(const std::string& path) {
    if (running_) {
        return false;
    }

    HANDLE dir = CreateFileW(to_wide(path).c_str(), FILE_LIST_DIRECTORY,
                             FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                             nullptr, OPEN_EXISTING,
                             FILE_FLAG_BACKUP_SEMANTICS | FILE_FLAG_OVERLAPPED, nullptr);
    if (dir == INVALID_HANDLE_VALUE) {
        FSMON_LOG_WARN("WatcherWindows", "Failed to open directory " + path +
                       " for watching: " + std::to_string(GetLastError()));
        return false;
    }

    dir_handle_ = dir;
    io_event_ = CreateEventW(nullptr, TRUE, FALSE, nullptr);
    stop_event_ = CreateEventW(nullptr, TRUE, FALSE, nullptr);
    overlapped_ = new OVERLAPPED();
    watch_path_ = path;

    if (!arm()) {
        FSMON_LOG_WARN("WatcherWindows", "Failed to start directory watching for " + path +
                       ": " + std::to_string(GetLastError()));
        CloseHandle(static_cast<HANDLE>(dir_handle_));
        CloseHandle(static_cast<HANDLE>(io_event_));
        CloseHandle(static_cast<HANDLE>(stop_event_));
        delete static_cast<OVERLAPPED*>(overlapped_);
        dir_handle_ = INVALID_HANDLE_VALUE;
        io_event_ = stop_event_ = overlapped_ = nullptr;
        return false;
    }

    running_ = true;
    watch_thread_ = std::thread(&WatcherWindows::watch_loop, this);

    FSMON_LOG_DEBUG("WatcherWindows", "Now watching directory: " + path);
    return true;
}

void WatcherWindows::stop() {
    bool was_running = running_.exchange(false);
    if (stop_event_) {
        SetEvent(static_cast<HANDLE>(stop_event_));
    }

    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }

    if (dir_handle_ != INVALID_HANDLE_VALUE) {
        HANDLE dir = static_cast<HANDLE>(dir_handle_);
        auto* ov = static_cast<OVERLAPPED*>(overlapped_);
        CancelIoEx(dir, ov);
        DWORD ignored = 0;
        GetOverlappedResult(dir, ov, &ignored, TRUE);
        CloseHandle(dir);
        dir_handle_ = INVALID_HANDLE_VALUE;
    }
    if (io_event_) {
        CloseHandle(static_cast<HANDLE>(io_event_));
        io_event_ = nullptr;
    }
    if (stop_event_) {
        CloseHandle(static_cast<HANDLE>(stop_event_));
        stop_event_ = nullptr;
    }
    delete static_cast<OVERLAPPED*>(overlapped_);
    overlapped_ = nullptr;

    if (was_running) {
        FSMON_LOG_DEBUG("WatcherWindows", "Stopped watching directory: " + watch_path_);
    }
}

bool WatcherWindows::is_running() const {
    return running_;
}

std::string WatcherWindows::get_watched_path() const {
    return watch_path_;
}

bool WatcherWindows::arm() {
    auto* ov = static_cast<OVERLAPPED*>(overlapped_);
    ZeroMemory(ov, sizeof(OVERLAPPED));
    ov->hEvent = static_cast<HANDLE>(io_event_);
    ResetEvent(ov->hEvent);

    return ReadDirectoryChangesW(static_cast<HANDLE>(dir_handle_), buffer_, sizeof(buffer_),
                                 FALSE,  // Don't watch subdirectories
                                 kNotifyFilter, nullptr, ov, nullptr) != 0;
}

void WatcherWindows::watch_loop() {
    HANDLE handles[2] = { static_cast<HANDLE>(stop_event_), static_cast<HANDLE>(io_event_) };

    while (running_) {
        DWORD wait_result = WaitForMultipleObjects(2, handles, FALSE, INFINITE);
        if (wait_result == WAIT_OBJECT_0) {
            break;
        }
        if (wait_result != WAIT_OBJECT_0 + 1) {
            FSMON_LOG_ERROR("WatcherWindows", "Wait failed on " + watch_path_ + ": " +
                            std::to_string(GetLastError()));
            break;
        }

        DWORD bytes = 0;
        if (!GetOverlappedResult(static_cast<HANDLE>(dir_handle_),
                                 static_cast<OVERLAPPED*>(overlapped_), &bytes, FALSE)) {
            DWORD err = GetLastError();
            if (err == ERROR_ACCESS_DENIED) {
                FSMON_LOG_DEBUG("WatcherWindows", "Watched directory went away: " + watch_path_);
                emit(FsEvent(FsEventType::WATCH_LOST, watch_path_, true));
                break;
            }
            FSMON_LOG_ERROR("WatcherWindows", "GetOverlappedResult failed on " + watch_path_ +
                            ": " + std::to_string(err));
            break;
        }

        if (bytes == 0) {
            FSMON_LOG_WARN("WatcherWindows", "Change buffer overflow on " + watch_path_);
        } else {
            process_buffer(bytes);
        }

        if (!running_ || !arm()) {
            break;
        }
    }
}

void WatcherWindows::process_buffer(unsigned long /*bytes*/) {
    auto* fni = reinterpret_cast<FILE_NOTIFY_INFORMATION*>(buffer_);

    while (true) {
        std::string name = to_utf8(fni->FileName, fni->FileNameLength / sizeof(WCHAR));
        std::string full_path = watch_path_;
        if (full_path.back() != '/') {
            full_path += '/';
        }
        full_path += name;

        FsEventType type;
        bool known = true;
        switch (fni->Action) {
            case FILE_ACTION_ADDED:
            case FILE_ACTION_RENAMED_NEW_NAME:
                type = FsEventType::CREATED;
                break;
            case FILE_ACTION_REMOVED:
            case FILE_ACTION_RENAMED_OLD_NAME:
                type = FsEventType::DELETED;
                break;
            case FILE_ACTION_MODIFIED:
                type = FsEventType::MODIFIED;
                break;
            default:
                known = false;
                type = FsEventType::MODIFIED;
                break;
        }

        if (known) {
            bool is_dir = false;
            bool is_link = false;
            if (type != FsEventType::DELETED) {
                DWORD attrs = GetFileAttributesW(to_wide(full_path).c_str());
                if (attrs != INVALID_FILE_ATTRIBUTES) {
                    is_dir = (attrs & FILE_ATTRIBUTE_DIRECTORY) != 0;
                    is_link = (attrs & FILE_ATTRIBUTE_REPARSE_POINT) != 0;
                }
            }
            if (!(type == FsEventType::MODIFIED && is_dir && !is_link)) {
                emit(FsEvent(type, full_path, is_dir, is_link));
            }
        }

        if (fni->NextEntryOffset == 0) break;
        fni = reinterpret_cast<FILE_NOTIFY_INFORMATION*>(
            reinterpret_cast<unsigned char*>(fni) + fni->NextEntryOffset);
    }
}

#else // !_WIN32

WatcherWindows::WatcherWindows()
    : running_(false)
    , dir_handle_(nullptr)
    , io_event_(nullptr)
    , stop_event_(nullptr)
    , overlapped_(nullptr) {
}

WatcherWindows::~WatcherWindows() = default;

bool WatcherWindows::is_supported() {
    return false;
}

bool WatcherWindows::start(const std::string& path) {
    FSMON_LOG_WARN("WatcherWindows", "ReadDirectoryChangesW is unavailable on this platform: " + path);
    return false;
}

void WatcherWindows::stop() {
}

bool WatcherWindows::is_running() const {
    return false;
}

std::string WatcherWindows::get_watched_path() const {
    return watch_path_;
}

void WatcherWindows::watch_loop() {
}

bool WatcherWindows::arm() {
    return false;
}

void WatcherWindows::process_buffer(unsigned long) {
}

#endif // _WIN32

} // namespace watchers
} // namespace fsmon
