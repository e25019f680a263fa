/**
 * @file container_lock_manager.hpp
 * @brief Per-container mutual exclusion for read-head-then-commit sequences
 *
 * A commit reads the head of a container's revision history and then
 * appends a version naming it as predecessor. Two such sequences on the
 * same container must not interleave; sequences on distinct containers
 * are independent.
 */

#pragma once

#include <ehr/core/result.hpp>
#include <ehr/identification/hier_object_id.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ehr::workflow {

// =============================================================================
// Lock Handle
// =============================================================================

/**
 * @brief Mutex of one container plus a flag readable without locking it
 */
struct container_lock_entry {
    std::mutex mutex;
    std::atomic<bool> held{false};
};

/**
 * @brief Exclusive hold on one container, released on destruction
 */
class container_lock {
public:
    /**
     * @param entry Entry whose mutex is owned by lock
     * @param lock Lock on entry->mutex
     */
    container_lock(std::shared_ptr<container_lock_entry> entry, std::string container_uid,
                   std::unique_lock<std::mutex> lock);
    ~container_lock();

    container_lock(container_lock&& other) noexcept = default;
    auto operator=(container_lock&& other) noexcept -> container_lock&;

    container_lock(const container_lock&) = delete;
    auto operator=(const container_lock&) -> container_lock& = delete;

    [[nodiscard]] auto owns_lock() const noexcept -> bool { return lock_.owns_lock(); }

    [[nodiscard]] auto container_uid() const noexcept -> const std::string& {
        return container_uid_;
    }

    /**
     * @brief Release before the handle goes out of scope
     */
    void unlock();

private:
    // Declared before lock_ so the mutex outlives the lock
    std::shared_ptr<container_lock_entry> entry_;
    std::string container_uid_;
    std::unique_lock<std::mutex> lock_;
};

// =============================================================================
// Lock Statistics
// =============================================================================

/**
 * @brief Statistics for lock manager operations
 */
struct lock_manager_stats {
    /// Number of containers with a tracked mutex
    std::size_t tracked_containers{0};

    /// Total locks acquired
    std::uint64_t total_acquisitions{0};

    /// Number of times a caller found the container already locked
    std::uint64_t contention_count{0};
};

// =============================================================================
// Lock Manager
// =============================================================================

/**
 * @class container_lock_manager
 * @brief Hands out one mutex per container identifier
 *
 * Thread Safety: all methods are thread-safe.
 *
 * @example
 * @code
 * container_lock_manager locks;
 * {
 *     auto hold = locks.acquire(container_uid);
 *     // read head, build version, commit
 * }
 *
 * auto attempt = locks.try_acquire(container_uid);
 * if (attempt.is_err()) {
 *     // container_locked
 * }
 * @endcode
 */
class container_lock_manager {
public:
    container_lock_manager() = default;

    container_lock_manager(const container_lock_manager&) = delete;
    auto operator=(const container_lock_manager&) -> container_lock_manager& = delete;

    /**
     * @brief Block until the container is free and lock it
     */
    [[nodiscard]] auto acquire(const identification::hier_object_id& uid) -> container_lock;

    /**
     * @brief Lock the container if it is free
     * @return The lock, or container_locked
     */
    [[nodiscard]] auto try_acquire(const identification::hier_object_id& uid)
        -> Result<container_lock>;

    /**
     * @brief Check whether some caller currently holds the container
     */
    [[nodiscard]] auto is_locked(const identification::hier_object_id& uid) const -> bool;

    /**
     * @brief Forget mutexes no caller holds
     * @return Number of entries removed
     */
    auto release_unused() -> std::size_t;

    [[nodiscard]] auto get_stats() const -> lock_manager_stats;

private:
    [[nodiscard]] auto entry_for(const std::string& key) -> std::shared_ptr<container_lock_entry>;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<container_lock_entry>> locks_;
    std::uint64_t total_acquisitions_{0};
    std::uint64_t contention_count_{0};
};

}  // namespace ehr::workflow
