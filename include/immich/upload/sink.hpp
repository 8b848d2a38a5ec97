#pragma once

#include "immich/api/upload.hpp"
#include "immich/core/result.hpp"
#include "immich/upload/channel.hpp"

#include <functional>
#include <mutex>
#include <vector>

namespace immich::upload {

/**
 * @brief Receives upload outcomes from the engine in completion order
 *
 * The engine serializes calls to deliver() unless concurrent() returns
 * true. An error from deliver() means the observer is gone; the engine stops
 * pulling new assets and run() reports ErrorCode::Engine.
 */
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual Result<void> deliver(api::UploadOutcome outcome) = 0;

    /**
     * @brief true when deliver() may be called from several workers at once
     */
    virtual bool concurrent() const noexcept { return false; }
};

/**
 * @brief Sink that forwards each outcome to a callback
 *
 * A callback that throws turns into a delivery error.
 */
class CallbackSink : public ResultSink {
public:
    using Callback = std::function<void(const api::UploadOutcome&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    Result<void> deliver(api::UploadOutcome outcome) override;

private:
    Callback callback_;
};

/**
 * @brief Sink that keeps every outcome it receives
 */
class CollectingSink : public ResultSink {
public:
    Result<void> deliver(api::UploadOutcome outcome) override;

    bool concurrent() const noexcept override { return true; }

    std::vector<api::UploadOutcome> outcomes() const;

    /**
     * @brief Move the collected outcomes out, leaving the sink empty
     */
    std::vector<api::UploadOutcome> take();

private:
    mutable std::mutex mutex_;
    std::vector<api::UploadOutcome> outcomes_;
};

/**
 * @brief Sink that pushes outcomes into a BoundedChannel
 *
 * Delivery blocks while the channel is full. Closing the channel from the
 * receiving side makes the next delivery fail.
 */
class ChannelSink : public ResultSink {
public:
    explicit ChannelSink(BoundedChannel<api::UploadOutcome>& channel) : channel_(channel) {}

    Result<void> deliver(api::UploadOutcome outcome) override;

    bool concurrent() const noexcept override { return true; }

private:
    BoundedChannel<api::UploadOutcome>& channel_;
};

/**
 * @brief Sink that shows each outcome to an optional observer, then keeps it
 *
 * An observer error is returned without delivering to the primary sink.
 * Concurrent only when both sides are.
 */
class TeeSink : public ResultSink {
public:
    TeeSink(ResultSink& primary, ResultSink* observer) : primary_(primary), observer_(observer) {}

    Result<void> deliver(api::UploadOutcome outcome) override;

    bool concurrent() const noexcept override {
        return primary_.concurrent() && (observer_ == nullptr || observer_->concurrent());
    }

private:
    ResultSink& primary_;
    ResultSink* observer_;
};

} // namespace immich::upload
