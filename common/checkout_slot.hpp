#pragma once

#include "sync.hpp"

#include <utility>

namespace vrb {

// A mutex-guarded slot for a single owning pointer (e.g. std::unique_ptr).
// The resource is checked out for exclusive use and the lock is *not* held
// while it is in use; other threads see an empty slot in the meantime.
template<typename Ptr>
class checkout_slot {
public:
    checkout_slot() = default;
    checkout_slot(const checkout_slot&) = delete;
    checkout_slot& operator=(const checkout_slot&) = delete;

    // install a new resource; returns the previous one (might be empty)
    Ptr exchange(Ptr p) {
        sync::scoped_lock<sync::mutex> lock(mutex_);
        return std::exchange(ptr_, std::move(p));
    }

    // take the resource; returns an empty pointer if the slot is empty
    Ptr checkout() {
        sync::scoped_lock<sync::mutex> lock(mutex_);
        return std::move(ptr_);
    }

    // take the resource only if it matches the predicate
    template<typename Pred>
    Ptr checkout_if(Pred&& pred) {
        sync::scoped_lock<sync::mutex> lock(mutex_);
        if (ptr_ && pred(*ptr_)) {
            return std::move(ptr_);
        } else {
            return Ptr{};
        }
    }

    // put a checked out resource back. If the slot has been refilled
    // in the meantime, the resource is handed back to the caller.
    Ptr restore(Ptr p) {
        sync::scoped_lock<sync::mutex> lock(mutex_);
        if (!ptr_) {
            ptr_ = std::move(p);
            return Ptr{};
        } else {
            return p;
        }
    }

    bool empty() const {
        sync::scoped_lock<sync::mutex> lock(mutex_);
        return !ptr_;
    }
private:
    mutable sync::mutex mutex_;
    Ptr ptr_;
};

} // vrb
