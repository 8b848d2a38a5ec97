/**
 * @file engine.hpp
 * @brief Bounded worker pool that uploads a lazy sequence of assets
 *
 * WORKER LIFECYCLE:
 * Idle -> Fetching -> Uploading -> Reporting -> Idle
 * A worker exits when Fetching comes back empty, which also happens after
 * a cancel or a sink failure. run() returns once every worker exited.
 *
 * EXAMPLE:
 * SessionUploader uploader(session);
 * ParallelUploadEngine engine(uploader);
 * DirectoryAssetSource source("/photos");
 * CallbackSink sink([](const UploadOutcome& o) { ... });
 * auto summary = engine.run(4, source, sink);
 */

#pragma once

#include "immich/api/upload.hpp"
#include "immich/core/result.hpp"
#include "immich/upload/sink.hpp"
#include "immich/upload/source.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace immich::upload {

/**
 * @brief Shared flag that stops a run from pulling further assets
 *
 * Uploads already in flight finish and are reported.
 */
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

struct EngineOptions {
    /// Cancel the run once an upload fails with ErrorCode::Auth
    bool stop_on_auth_failure = false;

    /// Checked before every pull of every run; may be null
    std::shared_ptr<CancelToken> cancel_token;
};

/**
 * @brief Counts for one run
 *
 * pulled counts every item taken from the source, including items that
 * failed to build; created + duplicate + failed == pulled.
 */
struct RunSummary {
    std::size_t pulled = 0;
    std::size_t created = 0;
    std::size_t duplicate = 0;
    std::size_t failed = 0;
    bool cancelled = false;
};

/**
 * @brief Fans assets out across at most `limit` concurrent uploads
 *
 * GUARANTEES:
 * - At most `limit` uploads are in flight at any instant
 * - The source is pulled by one worker at a time; each item is taken once
 * - Every pulled item yields exactly one outcome, delivered before run()
 *   returns, unless the sink has already failed
 * - A failed upload never stops the others and is never retried
 *
 * BACKPRESSURE:
 * A worker pulls only after it has delivered its previous outcome, so a
 * slow sink throttles the whole run.
 *
 * THREAD SAFETY:
 * The uploader is called from several threads at once. The sink is
 * serialized unless it reports concurrent(). One engine may run several
 * batches, one after another or at the same time. An auth stop ends only the
 * run that saw the failure; the caller's token stops every run observing it.
 */
class ParallelUploadEngine {
public:
    explicit ParallelUploadEngine(api::AssetUploader& uploader, EngineOptions options = {});

    /**
     * @brief Upload everything the source yields
     *
     * RETURNS: Summary of the run, or
     *          ErrorCode::InvalidConfig when limit is 0 (nothing pulled),
     *          ErrorCode::Engine when the sink failed or no worker could start
     * BLOCKS: Yes, until the source is exhausted or the run cancelled, and
     *         all in-flight uploads have been reported
     */
    Result<RunSummary> run(std::size_t limit, AssetSource& source, ResultSink& sink);

private:
    struct RunState;

    void worker(RunState& state);
    bool stopping(const RunState& state) const noexcept;
    std::optional<AssetResult> fetch(RunState& state);
    api::UploadOutcome upload(RunState& state, const asset::Asset& asset);
    void report(RunState& state, api::UploadOutcome outcome);

    api::AssetUploader& uploader_;
    EngineOptions options_;
};

} // namespace immich::upload
