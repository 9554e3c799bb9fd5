#include "livelink/util/cancellation.hpp"

#include <mutex>
#include <vector>

namespace livelink::util {

struct CancellationToken::State {
    std::mutex mutex;
    bool cancelled{false};
    std::vector<std::function<void()>> callbacks;
};

bool CancellationToken::cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

void CancellationToken::on_cancel(std::function<void()> callback) const {
    if (!state_ || !callback) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            state_->callbacks.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

bool CancellationSource::cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return false;
        }
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }
    for (auto& callback : callbacks) {
        callback();
    }
    return true;
}

bool CancellationSource::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

}  // namespace livelink::util
