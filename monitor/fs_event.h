#ifndef FSMON_FS_EVENT_H
#define FSMON_FS_EVENT_H

#include <cstdint>
#include <string>

namespace fsmon {

/**
 * @brief Logical event kinds delivered to listeners
 */
enum class FsEventKind {
    FILE_CREATED,
    FILE_MODIFIED,
    FILE_DELETED,
    DIRECTORY_CREATED,
    DIRECTORY_DELETED,
    SYMLINK_CREATED,
    SYMLINK_DELETED,
    SYMLINK_TARGET_CHANGED
};

inline const char* event_kind_to_string(FsEventKind kind) {
    switch (kind) {
        case FsEventKind::FILE_CREATED: return "file_created";
        case FsEventKind::FILE_MODIFIED: return "file_modified";
        case FsEventKind::FILE_DELETED: return "file_deleted";
        case FsEventKind::DIRECTORY_CREATED: return "directory_created";
        case FsEventKind::DIRECTORY_DELETED: return "directory_deleted";
        case FsEventKind::SYMLINK_CREATED: return "symlink_created";
        case FsEventKind::SYMLINK_DELETED: return "symlink_deleted";
        case FsEventKind::SYMLINK_TARGET_CHANGED: return "symlink_target_changed";
        default: return "unknown";
    }
}

inline bool is_created_kind(FsEventKind kind) {
    return kind == FsEventKind::FILE_CREATED || kind == FsEventKind::DIRECTORY_CREATED ||
           kind == FsEventKind::SYMLINK_CREATED;
}

inline bool is_deleted_kind(FsEventKind kind) {
    return kind == FsEventKind::FILE_DELETED || kind == FsEventKind::DIRECTORY_DELETED ||
           kind == FsEventKind::SYMLINK_DELETED;
}

/**
 * @brief A classified event, shared by every listener it matches
 *
 * target holds the link text for symlink events; old_target is only set
 * for SYMLINK_TARGET_CHANGED.
 */
struct FileSystemEvent {
    FsEventKind kind{FsEventKind::FILE_MODIFIED};
    std::string path;
    std::string target;
    std::string old_target;
    uint64_t timestamp{0};
};

} // namespace fsmon

#endif // FSMON_FS_EVENT_H
