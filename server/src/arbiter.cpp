#include "shellfs/server/arbiter.hpp"

namespace shellfs::server
{

    ConnectionArbiter::Lease::Lease(Lease &&other) noexcept : owner_(std::move(other.owner_)) {}

    ConnectionArbiter::Lease &ConnectionArbiter::Lease::operator=(Lease &&other) noexcept
    {
        if (this != &other)
        {
            release();
            owner_ = std::move(other.owner_);
        }
        return *this;
    }

    ConnectionArbiter::Lease::~Lease()
    {
        release();
    }

    void ConnectionArbiter::Lease::release() noexcept
    {
        if (owner_)
        {
            owner_->state_.store(State::Idle, std::memory_order_release);
            owner_.reset();
        }
    }

    std::optional<ConnectionArbiter::Lease> ConnectionArbiter::try_acquire()
    {
        auto expected = State::Idle;
        if (!state_.compare_exchange_strong(expected, State::Busy, std::memory_order_acq_rel))
        {
            return std::nullopt;
        }
        return Lease(shared_from_this());
    }

} // namespace shellfs::server
