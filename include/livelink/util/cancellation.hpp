#pragma once

#include <functional>
#include <memory>
#include <utility>

namespace livelink::util {

class CancellationSource;

/**
 * Read side of a one-shot cancellation signal. Any number of tokens may
 * observe the same source; callbacks registered after cancellation run
 * immediately on the registering thread.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool cancelled() const;
    void on_cancel(std::function<void()> callback) const;

private:
    struct State;
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const;

    // Returns false if the source had already been cancelled.
    bool cancel();
    bool cancelled() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

}  // namespace livelink::util
