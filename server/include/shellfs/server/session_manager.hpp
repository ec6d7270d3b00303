#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "shellfs/server/session.hpp"

namespace shellfs::server
{

    /// Owns every datagram-transport session, keyed by the peer's address.
    ///
    /// Access goes through a Lease, which holds the session's mutex for its lifetime so
    /// requests from one address are applied one at a time. The idle sweep only evicts
    /// sessions whose mutex it can take without waiting.
    class SessionManager
    {
        struct Entry
        {
            std::mutex mutex;
            Session session;
            bool evicted{false};
        };

    public:
        using Clock = Session::Clock;

        class Lease
        {
        public:
            Lease(Lease &&) noexcept = default;
            Lease &operator=(Lease &&) noexcept = default;

            Session &operator*() const noexcept { return entry_->session; }
            Session *operator->() const noexcept { return &entry_->session; }

            bool created() const noexcept { return created_; }

            void touch(Clock::time_point now) noexcept { entry_->session.last_activity = now; }

        private:
            friend class SessionManager;

            Lease(std::shared_ptr<Entry> entry, std::unique_lock<std::mutex> lock, bool created)
                : entry_(std::move(entry)), lock_(std::move(lock)), created_(created) {}

            std::shared_ptr<Entry> entry_;
            std::unique_lock<std::mutex> lock_;
            bool created_{false};
        };

        explicit SessionManager(std::chrono::seconds idle_timeout);

        Lease get_or_create(const std::string &identity, Clock::time_point now);

        std::optional<Lease> get(const std::string &identity);

        bool touch(const std::string &identity, Clock::time_point now);

        /// Evicts sessions idle for at least the timeout, closing their transfers first.
        /// Sessions whose lease is currently held are skipped.
        std::size_t expire_idle(Clock::time_point now);

        std::size_t size() const;

        std::chrono::seconds idle_timeout() const noexcept { return idle_timeout_; }

    private:
        std::chrono::seconds idle_timeout_;
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<Entry>> sessions_;
    };

} // namespace shellfs::server
