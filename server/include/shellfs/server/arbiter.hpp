#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace shellfs::server
{

    /// Single-client admission for the stream transport.
    ///
    /// Idle -> Busy happens in one compare-exchange, so two concurrent accepts can never
    /// both be admitted. The returned Lease flips the state back to Idle when destroyed.
    class ConnectionArbiter : public std::enable_shared_from_this<ConnectionArbiter>
    {
    public:
        enum class State : std::uint8_t
        {
            Idle,
            Busy
        };

        class Lease
        {
        public:
            Lease(Lease &&other) noexcept;
            Lease &operator=(Lease &&other) noexcept;
            Lease(const Lease &) = delete;
            Lease &operator=(const Lease &) = delete;
            ~Lease();

            void release() noexcept;

        private:
            friend class ConnectionArbiter;

            explicit Lease(std::shared_ptr<ConnectionArbiter> owner) : owner_(std::move(owner)) {}

            std::shared_ptr<ConnectionArbiter> owner_;
        };

        /// Must be owned by a std::shared_ptr; leases keep the arbiter alive.
        std::optional<Lease> try_acquire();

        State state() const noexcept { return state_.load(std::memory_order_acquire); }

    private:
        std::atomic<State> state_{State::Idle};
    };

} // namespace shellfs::server
