#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "lbhttp/event_stream.hpp"

namespace lbhttp {

    /// @brief Why try_acquire() did or did not hand out a permit.
    enum class AcquireOutcome : std::uint8_t {
        Accepted,
        RejectedTemporary,   ///< Exhausted or reserved; retry later.
        RejectedPermanently  ///< Closed; never retry on this connection.
    };

    inline const char* to_string(AcquireOutcome o) {
        switch (o) {
            case AcquireOutcome::Accepted:
                return "Accepted";
            case AcquireOutcome::RejectedTemporary:
                return "RejectedTemporary";
            case AcquireOutcome::RejectedPermanently:
                return "RejectedPermanently";
        }
        return "Unknown";
    }

    /**
     * Per-connection request concurrency gate with an exclusive reservation.
     *
     * SAFETY:
     * - All public methods are thread-safe; one mutex orders acquire,
     *   release, resize and close.
     * - Never throws from permit/reservation bookkeeping.
     *
     * INVARIANTS:
     * 1. granted <= max at the moment of every grant
     * 2. reserved implies granted == 0
     * 3. Once closed, nothing is granted again
     *
     * LIFECYCLE:
     * 1. create() with the initial maximum
     * 2. subscribe() to the connection's MAX_CONCURRENCY stream and to its
     *    closing notifier
     * 3. Closing notification -> Closed (terminal)
     */
    class ReservableRequestConcurrencyController
        : public std::enable_shared_from_this<
              ReservableRequestConcurrencyController> {
        struct Key {};

       public:
        enum class State : std::uint8_t { Available, Exhausted, Reserved, Closed };

        /**
         * RAII handle for one granted permit.
         *
         * Releasing (explicitly or by destruction) returns exactly one
         * permit. A permit that outlives its controller is inert.
         */
        class Permit {
           public:
            Permit() = default;
            Permit(Permit&& other) noexcept
                : owner_(std::move(other.owner_)), held_(other.held_) {
                other.owner_.reset();
                other.held_ = false;
            }
            Permit& operator=(Permit&& other) noexcept {
                if (this != &other) {
                    release();
                    owner_ = std::move(other.owner_);
                    held_ = other.held_;
                    other.owner_.reset();
                    other.held_ = false;
                }
                return *this;
            }
            Permit(Permit const&) = delete;
            Permit& operator=(Permit const&) = delete;
            ~Permit() { release(); }

            explicit operator bool() const noexcept { return held_; }

            /// @brief Give the permit back. Later calls are no-ops.
            void release() noexcept {
                if (!held_) return;
                held_ = false;
                if (auto c = owner_.lock()) c->on_permit_released();
                owner_.reset();
            }

           private:
            friend class ReservableRequestConcurrencyController;
            explicit Permit(
                std::weak_ptr<ReservableRequestConcurrencyController> owner)
                : owner_(std::move(owner)), held_(true) {}

            std::weak_ptr<ReservableRequestConcurrencyController> owner_;
            bool held_{false};
        };

        /// @brief RAII handle for the exclusive reservation.
        class Reservation {
           public:
            Reservation() = default;
            Reservation(Reservation&& other) noexcept
                : owner_(std::move(other.owner_)), held_(other.held_) {
                other.owner_.reset();
                other.held_ = false;
            }
            Reservation& operator=(Reservation&& other) noexcept {
                if (this != &other) {
                    release();
                    owner_ = std::move(other.owner_);
                    held_ = other.held_;
                    other.owner_.reset();
                    other.held_ = false;
                }
                return *this;
            }
            Reservation(Reservation const&) = delete;
            Reservation& operator=(Reservation const&) = delete;
            ~Reservation() { release(); }

            explicit operator bool() const noexcept { return held_; }

            /// @brief End the reservation. Later calls are no-ops.
            void release() noexcept {
                if (!held_) return;
                held_ = false;
                if (auto c = owner_.lock()) c->on_reservation_released();
                owner_.reset();
            }

           private:
            friend class ReservableRequestConcurrencyController;
            explicit Reservation(
                std::weak_ptr<ReservableRequestConcurrencyController> owner)
                : owner_(std::move(owner)), held_(true) {}

            std::weak_ptr<ReservableRequestConcurrencyController> owner_;
            bool held_{false};
        };

        static std::shared_ptr<ReservableRequestConcurrencyController> create(
            std::size_t initial_max) {
            return std::make_shared<ReservableRequestConcurrencyController>(
                Key{}, initial_max);
        }

        ReservableRequestConcurrencyController(Key, std::size_t initial_max)
            : max_(initial_max) {}

        /// @brief Follow max-concurrency updates and the closing notifier.
        /// Either source may be null. Completion of the max-concurrency
        /// stream does not close the controller; closing does.
        void subscribe(EventStream<std::size_t>* max_concurrency,
                       CloseNotifier* on_closing);

        /// @brief Try to take one permit. Empty Permit on refusal.
        Permit try_acquire();

        /// @brief Same as try_acquire(), also reporting why it was refused.
        Permit try_acquire(AcquireOutcome& outcome);

        /// @brief Take the exclusive reservation. Empty on refusal.
        /// Succeeds only when open, unreserved, and no permit is out.
        Reservation try_reserve();

        /// @brief Replace the maximum. Outstanding permits are kept.
        void update_max_concurrency(std::size_t max);

        /// @brief Terminal. Idempotent.
        void close();

        State state() const;
        std::size_t granted() const;
        std::size_t max_concurrency() const;
        bool closed() const;

       private:
        void on_permit_released() noexcept;
        void on_reservation_released() noexcept;
        State state_locked() const noexcept;

        mutable std::mutex mu_;
        std::size_t max_;
        std::size_t granted_{0};
        bool reserved_{false};
        bool closed_{false};

        Subscription max_sub_;
        Subscription closing_sub_;
    };

    using ConcurrencyController = ReservableRequestConcurrencyController;

    inline const char* to_string(ReservableRequestConcurrencyController::State s) {
        using S = ReservableRequestConcurrencyController::State;
        switch (s) {
            case S::Available:
                return "Available";
            case S::Exhausted:
                return "Exhausted";
            case S::Reserved:
                return "Reserved";
            case S::Closed:
                return "Closed";
        }
        return "Unknown";
    }

}  // namespace lbhttp
