#pragma once

#include <boost/signals2/connection.hpp>
#include <boost/signals2/signal.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace lbhttp {

    /// @brief RAII subscription handle; destroying it unsubscribes.
    using Subscription = boost::signals2::scoped_connection;

    /// @brief Typed name of a transport event stream.
    template <typename T>
    struct HttpEventKey {
        std::string name;
    };

    /// @brief Maximum number of concurrent requests the connection accepts.
    inline const HttpEventKey<std::size_t> MAX_CONCURRENCY{"max-concurrency"};

    class EventStreamBase {
       public:
        virtual ~EventStreamBase() = default;
        virtual void complete() = 0;
    };

    /**
     * @brief Live, replaying stream of values of type T.
     *
     * A new subscriber first receives the latest value (if any), then every
     * later value, then a single completion. Delivery is serialized, so a
     * subscriber never observes values out of order.
     */
    template <typename T>
    class EventStream final : public EventStreamBase {
       public:
        using NextFn = std::function<void(T const&)>;
        using CompleteFn = std::function<void()>;

        [[nodiscard]] Subscription subscribe(NextFn on_next,
                                             CompleteFn on_complete = {}) {
            std::lock_guard<std::mutex> lk(mu_);
            if (completed_) {
                if (latest_ && on_next) on_next(*latest_);
                if (on_complete) on_complete();
                return Subscription{};
            }
            // Replay under the lock so no emit can slip in between.
            if (latest_ && on_next) on_next(*latest_);
            // nullptr is the completion signal
            Subscription sub(sig_.connect(
                [on_next = std::move(on_next),
                 on_complete = std::move(on_complete)](T const* v) {
                    if (v) {
                        if (on_next) on_next(*v);
                    } else if (on_complete) {
                        on_complete();
                    }
                }));
            return sub;
        }

        void emit(T value) {
            std::lock_guard<std::mutex> lk(mu_);
            if (completed_) return;
            latest_ = std::move(value);
            sig_(&*latest_);
        }

        /// @brief Terminal. Later emits are dropped.
        void complete() override {
            std::lock_guard<std::mutex> lk(mu_);
            if (completed_) return;
            completed_ = true;
            sig_(nullptr);
            sig_.disconnect_all_slots();
        }

        std::optional<T> latest() const {
            std::lock_guard<std::mutex> lk(mu_);
            return latest_;
        }

        bool completed() const {
            std::lock_guard<std::mutex> lk(mu_);
            return completed_;
        }

       private:
        mutable std::mutex mu_;
        boost::signals2::signal<void(T const*)> sig_;
        std::optional<T> latest_;
        bool completed_{false};
    };

    /**
     * @brief One-shot notification ("closing", "closed").
     *
     * Subscribing after the notification fired runs the callback
     * immediately.
     */
    class CloseNotifier {
       public:
        [[nodiscard]] Subscription subscribe(std::function<void()> fn) {
            std::unique_lock<std::mutex> lk(mu_);
            if (fired_) {
                lk.unlock();
                fn();
                return Subscription{};
            }
            return Subscription(sig_.connect(std::move(fn)));
        }

        /// @brief Fire once; later calls are no-ops.
        void notify() {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (fired_) return;
                fired_ = true;
            }
            sig_();
            sig_.disconnect_all_slots();
        }

        bool fired() const {
            std::lock_guard<std::mutex> lk(mu_);
            return fired_;
        }

       private:
        mutable std::mutex mu_;
        boost::signals2::signal<void()> sig_;
        bool fired_{false};
    };

    /**
     * @brief Transport event streams of one connection, keyed by event name.
     */
    class TransportEventRegistry {
       public:
        /// @brief The stream for key, created on first use.
        template <typename T>
        EventStream<T>& stream(HttpEventKey<T> const& key) {
            std::lock_guard<std::mutex> lk(mu_);
            auto& slot = streams_[key.name];
            if (!slot) slot = std::make_shared<EventStream<T>>();
            // A key name is only ever used with one T.
            return static_cast<EventStream<T>&>(*slot);
        }

        /// @brief Complete every stream, e.g. when the connection closes.
        void complete_all() {
            std::unordered_map<std::string, std::shared_ptr<EventStreamBase>>
                streams;
            {
                std::lock_guard<std::mutex> lk(mu_);
                streams = streams_;
            }
            for (auto& [_, s] : streams) s->complete();
        }

       private:
        std::mutex mu_;
        std::unordered_map<std::string, std::shared_ptr<EventStreamBase>>
            streams_;
    };

}  // namespace lbhttp
