#pragma once

#include "core/Logger.h"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <vector>

namespace labflow {

/// Ordered list of callbacks addressed by subscription id.
/// Observers may add or remove subscriptions (including their own) while
/// being notified; removed observers are not called for the rest of the pass.
template <typename... Args>
class ObserverList {
public:
    using Callback = std::function<void(Args...)>;

    uint32_t add(Callback callback)
    {
        if (!callback)
            return 0;
        uint32_t id = nextId_++;
        entries_.push_back({id, std::move(callback)});
        return id;
    }

    bool remove(uint32_t id)
    {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [id](const Entry& e) { return e.id == id; });
        if (it == entries_.end())
            return false;
        entries_.erase(it);
        return true;
    }

    bool contains(uint32_t id) const
    {
        return std::any_of(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    }

    void clear() { entries_.clear(); }
    int size() const { return static_cast<int>(entries_.size()); }
    bool empty() const { return entries_.empty(); }

    // Observer exceptions are logged and never reach the notifier.
    void notify(Args... args) const
    {
        auto snapshot = entries_;
        for (const auto& entry : snapshot)
        {
            if (!contains(entry.id))
                continue;
            try
            {
                entry.callback(args...);
            }
            catch (const std::exception& e)
            {
                LF_WARN("observer %u threw: %s", entry.id, e.what());
            }
            catch (...)
            {
                LF_WARN("observer %u threw a non-standard exception", entry.id);
            }
        }
    }

private:
    struct Entry {
        uint32_t id;
        Callback callback;
    };
    std::vector<Entry> entries_;
    uint32_t nextId_ = 1;
};

} // namespace labflow
