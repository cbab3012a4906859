#include "watch_handle.h"

namespace fsmon {

WatchHandle::WatchHandle(std::weak_ptr<IWatchHandleOwner> owner, ListenerId id, std::string pattern)
    : owner_(std::move(owner))
    , id_(id)
    , pattern_(std::move(pattern)) {
}

std::vector<std::string> WatchHandle::list_watched_paths() const {
    auto owner = owner_.lock();
    if (!owner) {
        return {};
    }
    return owner->watched_paths(id_);
}

bool WatchHandle::is_active() const {
    auto owner = owner_.lock();
    return owner && owner->is_listener_active(id_);
}

void WatchHandle::unregister() {
    if (auto owner = owner_.lock()) {
        owner->unregister(id_);
    }
}

} // namespace fsmon
