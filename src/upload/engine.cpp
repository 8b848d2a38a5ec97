#include "immich/upload/engine.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <functional>
#include <system_error>
#include <thread>
#include <vector>

namespace immich::upload {

// Everything the workers of one run share
struct ParallelUploadEngine::RunState {
    RunState(AssetSource& src, ResultSink& snk) : source(src), sink(snk) {}

    AssetSource& source;
    ResultSink& sink;

    std::mutex source_mutex;   // Single reader of the source
    bool exhausted = false;    // Guarded by source_mutex

    std::atomic<bool> auth_stopped{false};

    std::mutex sink_mutex;     // Serializes non-concurrent sinks
    std::atomic<bool> sink_failed{false};
    std::mutex error_mutex;
    std::optional<Error> sink_error;

    std::atomic<std::size_t> in_flight{0};
    std::atomic<std::size_t> pulled{0};
    std::atomic<std::size_t> created{0};
    std::atomic<std::size_t> duplicate{0};
    std::atomic<std::size_t> failed{0};
    std::atomic<std::size_t> dropped{0};
};

namespace {

api::UploadOutcome unbuildable(const Error& error) {
    // subject carries the path the asset was built from
    std::string id = std::filesystem::path(error.subject).filename().string();
    if (id.empty()) {
        id = error.subject;
    }
    return api::UploadOutcome::failed(std::move(id), error);
}

} // namespace

ParallelUploadEngine::ParallelUploadEngine(api::AssetUploader& uploader, EngineOptions options)
    : uploader_(uploader), options_(std::move(options)) {}

Result<RunSummary> ParallelUploadEngine::run(std::size_t limit, AssetSource& source, ResultSink& sink) {
    if (limit == 0) {
        return Err<RunSummary>(make_error(ErrorCode::InvalidConfig,
                                          "Concurrency limit must be at least 1"));
    }

    RunState state(source, sink);
    spdlog::info("Starting upload run with {} workers", limit);

    std::vector<std::thread> workers;
    workers.reserve(limit);
    for (std::size_t i = 0; i < limit; ++i) {
        try {
            workers.emplace_back(&ParallelUploadEngine::worker, this, std::ref(state));
        } catch (const std::system_error& e) {
            spdlog::warn("Could only start {} of {} workers: {}", workers.size(), limit, e.what());
            break;
        }
    }

    if (workers.empty()) {
        return Err<RunSummary>(make_error(ErrorCode::Engine, "Could not start any upload worker"));
    }

    for (auto& worker : workers) {
        worker.join();
    }

    RunSummary summary;
    summary.pulled = state.pulled.load();
    summary.created = state.created.load();
    summary.duplicate = state.duplicate.load();
    summary.failed = state.failed.load();
    summary.cancelled = stopping(state);

    if (state.sink_failed.load()) {
        const Error& cause = *state.sink_error;
        spdlog::error("Upload run aborted, result sink failed: {} ({} outcomes dropped)",
                      cause.message, state.dropped.load());
        return Err<RunSummary>(make_error(ErrorCode::Engine,
                                          "Result sink failed: " + cause.message,
                                          cause.subject));
    }

    spdlog::info("Upload run finished: {} pulled, {} created, {} duplicate, {} failed{}",
                 summary.pulled, summary.created, summary.duplicate, summary.failed,
                 summary.cancelled ? " (cancelled)" : "");
    return Ok(summary);
}

void ParallelUploadEngine::worker(RunState& state) {
    while (auto item = fetch(state)) {
        if (item->is_error()) {
            spdlog::warn("Skipping asset: {}", item->error().to_string());
            report(state, unbuildable(item->error()));
            continue;
        }
        report(state, upload(state, item->value()));
    }
}

bool ParallelUploadEngine::stopping(const RunState& state) const noexcept {
    if (state.auth_stopped.load()) {
        return true;
    }
    return options_.cancel_token && options_.cancel_token->cancelled();
}

std::optional<AssetResult> ParallelUploadEngine::fetch(RunState& state) {
    if (stopping(state) || state.sink_failed.load()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(state.source_mutex);
    if (state.exhausted) {
        return std::nullopt;
    }

    try {
        auto item = state.source.next();
        if (!item) {
            state.exhausted = true;
            return std::nullopt;
        }
        state.pulled.fetch_add(1);
        return item;
    } catch (const std::exception& e) {
        spdlog::error("Asset source threw, treating it as exhausted: {}", e.what());
        state.exhausted = true;
        return std::nullopt;
    }
}

api::UploadOutcome ParallelUploadEngine::upload(RunState& state, const asset::Asset& asset) {
    const auto active = state.in_flight.fetch_add(1) + 1;
    spdlog::debug("Uploading {} ({} in flight)", asset.device_asset_id(), active);
    auto outcome = [&]() {
        try {
            return uploader_.upload(asset);
        } catch (const std::exception& e) {
            spdlog::error("Uploader threw for {}: {}", asset.device_asset_id(), e.what());
            return api::UploadOutcome::failed(asset.device_asset_id(),
                                              make_error(ErrorCode::Internal, e.what()));
        }
    }();
    state.in_flight.fetch_sub(1);

    const auto& error = outcome.error();
    if (error && error->code == ErrorCode::Auth && options_.stop_on_auth_failure) {
        if (!state.auth_stopped.exchange(true)) {
            spdlog::warn("Server rejected the credential, not starting further uploads in this run");
        }
    }
    return outcome;
}

void ParallelUploadEngine::report(RunState& state, api::UploadOutcome outcome) {
    switch (outcome.status()) {
        case api::UploadStatus::Created:   state.created.fetch_add(1); break;
        case api::UploadStatus::Duplicate: state.duplicate.fetch_add(1); break;
        case api::UploadStatus::Failed:    state.failed.fetch_add(1); break;
    }

    const std::string id = outcome.device_asset_id();
    bool dropped = false;
    Result<void> delivered = Ok();
    {
        std::unique_lock<std::mutex> lock(state.sink_mutex, std::defer_lock);
        if (!state.sink.concurrent()) {
            lock.lock();
        }

        if (state.sink_failed.load()) {
            dropped = true;
        } else {
            try {
                delivered = state.sink.deliver(std::move(outcome));
            } catch (const std::exception& e) {
                delivered = Err<void>(make_error(ErrorCode::Engine, e.what(), id));
            }
        }
    }

    if (dropped) {
        state.dropped.fetch_add(1);
        spdlog::warn("Result sink unavailable, dropping outcome for {}", id);
        return;
    }

    if (delivered.is_error()) {
        std::lock_guard<std::mutex> lock(state.error_mutex);
        if (!state.sink_error) {
            state.sink_error = delivered.error();
            spdlog::error("Result sink failed: {}", delivered.error().to_string());
        }
        state.sink_failed.store(true);
        state.dropped.fetch_add(1);
    }
}

} // namespace immich::upload
