#include "codexec/cancellation_token.hh"
#include "codexec/logger.hh"

#include <exception>

namespace codexec {

void CancellationToken::cancel() {
    std::unique_lock lock{mtx_};
    if (cancelled_.load(std::memory_order_relaxed)) {
        return;
    }
    cancelled_.store(true, std::memory_order_release);

    // Listeners run without the lock, so that they may use the token. They are taken one at a
    // time, so that a listener removed before its turn never runs.
    std::exception_ptr first_exception;
    while (not listeners_.empty()) {
        auto [id, callback] = std::move(listeners_.front());
        listeners_.erase(listeners_.begin());
        firing_id_ = id;
        firing_thread_ = std::this_thread::get_id();
        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            if (first_exception) {
                errlog("cancellation listener failed: ", e.what());
            } else {
                first_exception = std::current_exception();
            }
        }
        lock.lock();
        firing_id_ = 0;
        listener_finished_.notify_all();
    }
    lock.unlock();
    if (first_exception) {
        std::rethrow_exception(first_exception);
    }
}

CancellationToken::ListenerId CancellationToken::on_cancel(Callback callback) {
    std::unique_lock lock{mtx_};
    auto id = next_listener_id_++;
    if (cancelled_.load(std::memory_order_relaxed)) {
        lock.unlock();
        callback();
        return id;
    }
    listeners_.emplace_back(id, std::move(callback));
    return id;
}

void CancellationToken::remove_listener(ListenerId id) noexcept {
    std::unique_lock lock{mtx_};
    std::erase_if(listeners_, [id](const auto& listener) { return listener.first == id; });
    // A listener removing itself would wait forever
    if (firing_id_ == id and firing_thread_ != std::this_thread::get_id()) {
        listener_finished_.wait(lock, [&] { return firing_id_ != id; });
    }
}

} // namespace codexec
