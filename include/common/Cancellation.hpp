#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace common {

    class CancellationRegistration;

    // The Token (View) - Passed to workers
    class CancellationToken {
        struct State {
            std::atomic<bool> requested{false};
            std::mutex mutex;
            uint64_t next_id = 0;
            std::map<uint64_t, std::function<void()>> callbacks;
        };
        std::shared_ptr<State> state;

    public:
        CancellationToken() : state(std::make_shared<State>()) {}

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        // Runs 'callback' once when cancellation fires, or right away on the
        // calling thread if it already has. The callback may run on the thread
        // calling CancellationSource::cancel(), and may still run shortly after
        // the registration is destroyed, so it must own what it touches.
        CancellationRegistration on_cancel(std::function<void()> callback) const;

        friend class CancellationSource;
        friend class CancellationRegistration;
    };

    // RAII handle for a callback registered with CancellationToken::on_cancel
    class CancellationRegistration {
    public:
        CancellationRegistration() = default;
        ~CancellationRegistration() { reset(); }

        CancellationRegistration(CancellationRegistration&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_) {}

        CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = other.id_;
            }
            return *this;
        }

        CancellationRegistration(const CancellationRegistration&) = delete;
        CancellationRegistration& operator=(const CancellationRegistration&) = delete;

        void reset() {
            if (auto state = std::move(state_)) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->callbacks.erase(id_);
            }
        }

    private:
        friend class CancellationToken;
        CancellationRegistration(std::shared_ptr<CancellationToken::State> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}

        std::shared_ptr<CancellationToken::State> state_;
        uint64_t id_ = 0;
    };

    inline CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const {
        if (!state) return {};
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->requested.load(std::memory_order_acquire)) {
                uint64_t id = state->next_id++;
                state->callbacks.emplace(id, std::move(callback));
                return CancellationRegistration(state, id);
            }
        }
        callback();
        return {};
    }

    // The Source (Owner) - Held by controller
    class CancellationSource {
        CancellationToken token;

    public:
        CancellationSource() {
            // Token wraps the shared state created in its constructor
        }

        // Set with RELEASE memory order (flushes prior writes).
        // Only the first call fires the callbacks; later calls do nothing.
        void cancel() {
            if (!token.state) return;

            std::map<uint64_t, std::function<void()>> fired;
            {
                std::lock_guard<std::mutex> lock(token.state->mutex);
                if (token.state->requested.exchange(true, std::memory_order_acq_rel)) {
                    return;
                }
                fired.swap(token.state->callbacks);
            }

            for (auto& entry : fired) {
                entry.second();
            }
        }

        bool is_cancelled() const { return token.is_cancellation_requested(); }

        CancellationToken get_token() const { return token; }

        void reset() {
            token = CancellationToken(); // Create fresh state
        }
    };

} // namespace common
