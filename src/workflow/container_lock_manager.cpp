/**
 * @file container_lock_manager.cpp
 * @brief Implementation of the per-container lock manager
 */

#include <ehr/workflow/container_lock_manager.hpp>

#include <ehr/compat/format.hpp>

namespace ehr::workflow {

// =============================================================================
// container_lock
// =============================================================================

container_lock::container_lock(std::shared_ptr<container_lock_entry> entry,
                               std::string container_uid,
                               std::unique_lock<std::mutex> lock)
    : entry_(std::move(entry)), container_uid_(std::move(container_uid)), lock_(std::move(lock)) {
    if (lock_.owns_lock()) {
        entry_->held.store(true);
    }
}

container_lock::~container_lock() { unlock(); }

auto container_lock::operator=(container_lock&& other) noexcept -> container_lock& {
    if (this != &other) {
        unlock();
        lock_ = std::move(other.lock_);
        entry_ = std::move(other.entry_);
        container_uid_ = std::move(other.container_uid_);
    }
    return *this;
}

void container_lock::unlock() {
    if (lock_.owns_lock()) {
        entry_->held.store(false);
        lock_.unlock();
    }
}

// =============================================================================
// container_lock_manager
// =============================================================================

auto container_lock_manager::acquire(const identification::hier_object_id& uid)
    -> container_lock {
    auto entry = entry_for(uid.value());

    std::unique_lock hold{entry->mutex, std::try_to_lock};
    if (!hold.owns_lock()) {
        {
            std::lock_guard lock{mutex_};
            ++contention_count_;
        }
        hold.lock();
    }

    {
        std::lock_guard lock{mutex_};
        ++total_acquisitions_;
    }
    return container_lock{std::move(entry), uid.value(), std::move(hold)};
}

auto container_lock_manager::try_acquire(const identification::hier_object_id& uid)
    -> Result<container_lock> {
    auto entry = entry_for(uid.value());

    std::unique_lock hold{entry->mutex, std::try_to_lock};
    if (!hold.owns_lock()) {
        std::lock_guard lock{mutex_};
        ++contention_count_;
        return ehr_error<container_lock>(
            error_codes::container_locked,
            compat::format("Versioned object {} is locked", uid.value()));
    }

    {
        std::lock_guard lock{mutex_};
        ++total_acquisitions_;
    }
    return container_lock{std::move(entry), uid.value(), std::move(hold)};
}

auto container_lock_manager::is_locked(const identification::hier_object_id& uid) const -> bool {
    std::lock_guard lock{mutex_};

    auto it = locks_.find(uid.value());
    return it != locks_.end() && it->second->held.load();
}

auto container_lock_manager::release_unused() -> std::size_t {
    std::lock_guard lock{mutex_};

    std::size_t removed = 0;
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.use_count() == 1) {
            it = locks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

auto container_lock_manager::get_stats() const -> lock_manager_stats {
    std::lock_guard lock{mutex_};

    lock_manager_stats stats;
    stats.tracked_containers = locks_.size();
    stats.total_acquisitions = total_acquisitions_;
    stats.contention_count = contention_count_;
    return stats;
}

auto container_lock_manager::entry_for(const std::string& key)
    -> std::shared_ptr<container_lock_entry> {
    std::lock_guard lock{mutex_};

    auto [it, inserted] = locks_.try_emplace(key);
    if (inserted) {
        it->second = std::make_shared<container_lock_entry>();
    }
    return it->second;
}

}  // namespace ehr::workflow
