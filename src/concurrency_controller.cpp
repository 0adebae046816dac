#include "lbhttp/connection/concurrency_controller.hpp"

#include "lbhttp/logging.hpp"

namespace lbhttp {

    void ReservableRequestConcurrencyController::subscribe(
        EventStream<std::size_t>* max_concurrency, CloseNotifier* on_closing) {
        std::weak_ptr<ReservableRequestConcurrencyController> weak =
            weak_from_this();
        if (max_concurrency) {
            max_sub_ = max_concurrency->subscribe([weak](std::size_t max) {
                if (auto self = weak.lock()) self->update_max_concurrency(max);
            });
        }
        if (on_closing) {
            closing_sub_ = on_closing->subscribe([weak] {
                if (auto self = weak.lock()) self->close();
            });
        }
    }

    ReservableRequestConcurrencyController::Permit
    ReservableRequestConcurrencyController::try_acquire() {
        AcquireOutcome ignored;
        return try_acquire(ignored);
    }

    ReservableRequestConcurrencyController::Permit
    ReservableRequestConcurrencyController::try_acquire(
        AcquireOutcome& outcome) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) {
            outcome = AcquireOutcome::RejectedPermanently;
            return Permit{};
        }
        if (reserved_ || granted_ >= max_) {
            outcome = AcquireOutcome::RejectedTemporary;
            return Permit{};
        }
        ++granted_;
        outcome = AcquireOutcome::Accepted;
        return Permit{weak_from_this()};
    }

    ReservableRequestConcurrencyController::Reservation
    ReservableRequestConcurrencyController::try_reserve() {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_ || reserved_ || granted_ != 0) return Reservation{};
        reserved_ = true;
        logger()->debug("concurrency controller reserved");
        return Reservation{weak_from_this()};
    }

    void ReservableRequestConcurrencyController::update_max_concurrency(
        std::size_t max) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return;
        logger()->debug("max concurrency {} -> {} ({} granted)", max_, max,
                        granted_);
        max_ = max;
    }

    void ReservableRequestConcurrencyController::close() {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return;
        closed_ = true;
        logger()->debug("concurrency controller closed ({} granted)",
                        granted_);
    }

    void ReservableRequestConcurrencyController::on_permit_released() noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        if (granted_ > 0) --granted_;
    }

    void ReservableRequestConcurrencyController::
        on_reservation_released() noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        reserved_ = false;
    }

    ReservableRequestConcurrencyController::State
    ReservableRequestConcurrencyController::state_locked() const noexcept {
        if (closed_) return State::Closed;
        if (reserved_) return State::Reserved;
        return granted_ < max_ ? State::Available : State::Exhausted;
    }

    ReservableRequestConcurrencyController::State
    ReservableRequestConcurrencyController::state() const {
        std::lock_guard<std::mutex> lk(mu_);
        return state_locked();
    }

    std::size_t ReservableRequestConcurrencyController::granted() const {
        std::lock_guard<std::mutex> lk(mu_);
        return granted_;
    }

    std::size_t ReservableRequestConcurrencyController::max_concurrency()
        const {
        std::lock_guard<std::mutex> lk(mu_);
        return max_;
    }

    bool ReservableRequestConcurrencyController::closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

}  // namespace lbhttp
