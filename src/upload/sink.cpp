#include "immich/upload/sink.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace immich::upload {

Result<void> CallbackSink::deliver(api::UploadOutcome outcome) {
    if (!callback_) {
        return Err<void>(make_error(ErrorCode::Engine, "Result callback is empty"));
    }

    try {
        callback_(outcome);
    } catch (const std::exception& e) {
        spdlog::error("Result callback threw: {}", e.what());
        return Err<void>(make_error(ErrorCode::Engine,
                                    std::string("Result callback threw: ") + e.what(),
                                    outcome.device_asset_id()));
    }
    return Ok();
}

Result<void> CollectingSink::deliver(api::UploadOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(std::move(outcome));
    return Ok();
}

std::vector<api::UploadOutcome> CollectingSink::outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

std::vector<api::UploadOutcome> CollectingSink::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<api::UploadOutcome> taken;
    taken.swap(outcomes_);
    return taken;
}

Result<void> ChannelSink::deliver(api::UploadOutcome outcome) {
    std::string id = outcome.device_asset_id();
    if (!channel_.send(std::move(outcome))) {
        return Err<void>(make_error(ErrorCode::Engine, "Outcome channel is closed", id));
    }
    return Ok();
}

Result<void> TeeSink::deliver(api::UploadOutcome outcome) {
    if (observer_) {
        auto observed = observer_->deliver(outcome);
        if (observed.is_error()) {
            return observed;
        }
    }
    return primary_.deliver(std::move(outcome));
}

} // namespace immich::upload
