#include "shellfs/server/session_manager.hpp"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace shellfs::server
{

    SessionManager::SessionManager(std::chrono::seconds idle_timeout) : idle_timeout_(idle_timeout) {}

    SessionManager::Lease SessionManager::get_or_create(const std::string &identity, Clock::time_point now)
    {
        for (;;)
        {
            std::shared_ptr<Entry> entry;
            bool created = false;
            {
                std::lock_guard lock(mutex_);
                auto &slot = sessions_[identity];
                if (!slot)
                {
                    slot = std::make_shared<Entry>();
                    slot->session.last_activity = now;
                    created = true;
                }
                entry = slot;
            }

            std::unique_lock session_lock(entry->mutex);
            if (!entry->evicted)
            {
                return Lease(std::move(entry), std::move(session_lock), created);
            }
            // Lost a race with the idle sweep; the slot is gone, look again.
        }
    }

    std::optional<SessionManager::Lease> SessionManager::get(const std::string &identity)
    {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard lock(mutex_);
            auto it = sessions_.find(identity);
            if (it == sessions_.end())
            {
                return std::nullopt;
            }
            entry = it->second;
        }

        std::unique_lock session_lock(entry->mutex);
        if (entry->evicted)
        {
            return std::nullopt;
        }
        return Lease(std::move(entry), std::move(session_lock), false);
    }

    bool SessionManager::touch(const std::string &identity, Clock::time_point now)
    {
        auto lease = get(identity);
        if (!lease)
        {
            return false;
        }
        lease->touch(now);
        return true;
    }

    std::size_t SessionManager::expire_idle(Clock::time_point now)
    {
        std::vector<std::pair<std::string, std::shared_ptr<Entry>>> candidates;
        {
            std::lock_guard lock(mutex_);
            candidates.assign(sessions_.begin(), sessions_.end());
        }

        std::size_t expired = 0;
        for (auto &[identity, entry] : candidates)
        {
            // A held lease means a request is in flight; look again on the next sweep.
            std::unique_lock session_lock(entry->mutex, std::try_to_lock);
            if (!session_lock.owns_lock())
            {
                continue;
            }
            if (entry->evicted || now - entry->session.last_activity < idle_timeout_)
            {
                continue;
            }
            if (entry->session.transfer_active())
            {
                spdlog::info("Abandoning transfer of {} for idle session {}",
                             entry->session.transfer->path.string(), identity);
            }
            entry->session.end_transfer();
            entry->evicted = true;
            {
                std::lock_guard lock(mutex_);
                auto it = sessions_.find(identity);
                if (it != sessions_.end() && it->second == entry)
                {
                    sessions_.erase(it);
                }
            }
            spdlog::info("Session {} expired after {}s idle", identity, idle_timeout_.count());
            ++expired;
        }
        return expired;
    }

    std::size_t SessionManager::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

} // namespace shellfs::server
