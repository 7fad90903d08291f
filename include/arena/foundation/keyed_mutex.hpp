#pragma once

/// @file keyed_mutex.hpp
/// @brief Lock table handing out one mutex per key.

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace arena::foundation {

/// Lazily creates one std::mutex per key so that unrelated keys never
/// contend. An entry lives only while some Handle for its key exists, so
/// the table holds just the keys currently in use.
///
/// @code
///   KeyedMutex<MatchId> locks;
///   auto handle = locks.get(matchId);
///   std::lock_guard guard(*handle);
/// @endcode
///
/// The handle must outlive any lock taken on it; declaring it before the
/// guard gives that order.
template <typename Key, typename Hash = std::hash<Key>>
class KeyedMutex {
public:
    /// Shared reference to one key's mutex.
    class Handle {
    public:
        Handle(Handle&& other) noexcept
            : table_(std::exchange(other.table_, nullptr)),
              key_(std::move(other.key_)),
              mutex_(std::move(other.mutex_)) {}

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;
        Handle& operator=(Handle&&) = delete;

        ~Handle() {
            if (table_ != nullptr) {
                table_->release(key_, std::move(mutex_));
            }
        }

        [[nodiscard]] std::mutex& operator*() const noexcept { return *mutex_; }
        [[nodiscard]] std::mutex* get() const noexcept { return mutex_.get(); }

    private:
        friend class KeyedMutex;

        Handle(KeyedMutex* table, Key key, std::shared_ptr<std::mutex> mutex)
            : table_(table), key_(std::move(key)), mutex_(std::move(mutex)) {}

        KeyedMutex* table_;
        Key key_;
        std::shared_ptr<std::mutex> mutex_;
    };

    [[nodiscard]] Handle get(const Key& key) {
        std::lock_guard lock(mutex_);
        auto& slot = locks_[key];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return Handle(this, key, slot);
    }

    /// Number of keys with at least one live handle.
    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return locks_.size();
    }

private:
    // Every copy and release of an entry happens under mutex_, so a use
    // count of one means only the table still refers to it.
    void release(const Key& key, std::shared_ptr<std::mutex> held) {
        std::lock_guard lock(mutex_);
        held.reset();
        auto it = locks_.find(key);
        if (it != locks_.end() && it->second.use_count() == 1) {
            locks_.erase(it);
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<Key, std::shared_ptr<std::mutex>, Hash> locks_;
};

} // namespace arena::foundation
