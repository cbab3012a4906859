#include "listener_table.h"

namespace fsmon {

const char* listener_state_to_string(ListenerState state) {
    switch (state) {
        case ListenerState::Unregistered: return "unregistered";
        case ListenerState::Registering: return "registering";
        case ListenerState::Active: return "active";
        case ListenerState::Unregistering: return "unregistering";
        case ListenerState::Removed: return "removed";
        default: return "unknown";
    }
}

ListenerTable::ListenerTable()
    : next_id_(1) {
}

std::shared_ptr<ListenerEntry> ListenerTable::add(std::shared_ptr<IFileSystemListener> listener,
                                                  PathPattern pattern,
                                                  std::chrono::milliseconds debounce) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : entries_) {
        if (entry->listener.get() == listener.get()) {
            return nullptr;
        }
    }

    auto entry = std::make_shared<ListenerEntry>(next_id_++, std::move(listener),
                                                 std::move(pattern), debounce);
    entry->state = ListenerState::Registering;
    entries_.emplace(entry->id, entry);
    return entry;
}

std::shared_ptr<ListenerEntry> ListenerTable::find(ListenerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<ListenerEntry> ListenerTable::find(const IFileSystemListener* listener) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : entries_) {
        if (entry->listener.get() == listener) {
            return entry;
        }
    }
    return nullptr;
}

void ListenerTable::remove(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(id);
}

size_t ListenerTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::shared_ptr<ListenerEntry>> ListenerTable::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<ListenerEntry>> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

} // namespace fsmon
