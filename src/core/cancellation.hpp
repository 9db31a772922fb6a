#pragma once

#include <atomic>
#include <memory>

namespace lanscout {

/**
 * CancellationToken - shared "stop now" flag.
 *
 * Copies share one flag. A child token observes its parent's cancellation
 * but cancelling the child leaves the parent untouched.
 *
 * cancel() is a single lock-free atomic store, so a signal handler may set
 * the flag through a pointer obtained from flag() beforehand.
 */
class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept {
        flag_->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        if (flag_->load(std::memory_order_acquire)) {
            return true;
        }
        return parent_ && parent_->is_cancelled();
    }

    [[nodiscard]] CancellationToken child() const {
        CancellationToken out;
        out.parent_ = std::make_shared<CancellationToken>(*this);
        return out;
    }

    // Own flag only; valid while any copy of this token lives.
    [[nodiscard]] std::atomic<bool>* flag() const noexcept {
        return flag_.get();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::shared_ptr<const CancellationToken> parent_;
};

static_assert(std::atomic<bool>::is_always_lock_free);

} // namespace lanscout
