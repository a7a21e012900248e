#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace codexec {

// Cooperative cancellation signal shared between the caller and the running execution.
// State changes only once: from pending to cancelled.
class CancellationToken {
public:
    using Callback = std::function<void()>;
    using ListenerId = uint64_t;

private:
    mutable std::mutex mtx_;
    std::atomic<bool> cancelled_{false};
    ListenerId next_listener_id_ = 1;
    std::vector<std::pair<ListenerId, Callback>> listeners_;
    // Listener being run by cancel(), 0 if none
    ListenerId firing_id_ = 0;
    std::thread::id firing_thread_;
    std::condition_variable listener_finished_;

public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken(CancellationToken&&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
    CancellationToken& operator=(CancellationToken&&) = delete;

    ~CancellationToken() = default;

    // Idempotent. The first call runs every registered listener exactly once, in registration
    // order, in the calling thread. If a listener throws, the remaining listeners still run
    // and the first exception is rethrown afterwards.
    void cancel();

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    // If the token is already cancelled, @p callback is run immediately
    ListenerId on_cancel(Callback callback);

    // After this returns the listener does not run: if it is being run by another thread,
    // waits for it to finish. Removing an unknown or already fired listener is a no-op.
    void remove_listener(ListenerId id) noexcept;
};

// Listener registration that lasts until the end of the scope
class ScopedCancelListener {
    CancellationToken& token_;
    CancellationToken::ListenerId id_;

public:
    ScopedCancelListener(CancellationToken& token, CancellationToken::Callback callback)
    : token_{token}
    , id_{token.on_cancel(std::move(callback))} {}

    ScopedCancelListener(const ScopedCancelListener&) = delete;
    ScopedCancelListener(ScopedCancelListener&&) = delete;
    ScopedCancelListener& operator=(const ScopedCancelListener&) = delete;
    ScopedCancelListener& operator=(ScopedCancelListener&&) = delete;

    ~ScopedCancelListener() { token_.remove_listener(id_); }
};

} // namespace codexec
