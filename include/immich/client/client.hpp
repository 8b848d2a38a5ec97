#pragma once

#include "immich/api/album.hpp"
#include "immich/api/bulk_check.hpp"
#include "immich/api/session.hpp"
#include "immich/api/upload.hpp"
#include "immich/core/config.hpp"
#include "immich/core/result.hpp"
#include "immich/upload/engine.hpp"
#include "immich/upload/sink.hpp"
#include "immich/upload/source.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace immich {

/**
 * @brief Outcomes of a batch upload together with the run's counts
 */
struct BatchResult {
    std::vector<api::UploadOutcome> outcomes;
    upload::RunSummary summary;
};

/**
 * @brief Everything a caller needs to talk to one server
 *
 * Wraps an authenticated Session. The connect functions create a
 * CurlTransport; tests and embedders with their own transport construct a
 * Session themselves and hand it over.
 *
 * Batch uploads take a concurrency limit, an asset source and optionally a
 * sink for progress. Individual asset failures are reported as Failed
 * outcomes; the batch itself fails only for a zero limit or a broken sink.
 */
class Client {
public:
    explicit Client(api::Session session);

    static Result<Client> login(std::string url,
                                const std::string& email,
                                const std::string& password,
                                ClientConfig config = {});

    static Result<Client> with_api_key(std::string url, std::string key, ClientConfig config = {});

    static Result<Client> with_token(std::string url, std::string token, ClientConfig config = {});

    [[nodiscard]] const api::Session& session() const noexcept { return session_; }

    Result<std::vector<api::Album>> albums() const;

    Result<api::Album> get_or_create_album(const std::string& name) const;

    api::UploadOutcome upload(const asset::Asset& asset) const;

    Result<std::vector<api::RemoteCheck>> bulk_check(const std::vector<asset::Asset>& assets) const;

    /**
     * @brief Upload everything from source and collect the outcomes
     *
     * Outcomes are in completion order.
     */
    Result<BatchResult> parallel_upload(std::size_t limit, upload::AssetSource& source) const;

    /**
     * @brief Upload everything from source, delivering each outcome to sink
     *
     * Delivery happens while the batch runs; a sink that blocks throttles it.
     */
    Result<upload::RunSummary> parallel_upload_with_progress(std::size_t limit,
                                                             upload::AssetSource& source,
                                                             upload::ResultSink& sink,
                                                             upload::EngineOptions options = {}) const;

    /**
     * @brief Upload everything from source, then add it to album
     *
     * Created and duplicate assets are both added. Assets that failed to
     * upload appear in the result with success == false and the upload error
     * text. When progress is given it sees every outcome as it completes.
     */
    Result<std::vector<api::AlbumAssetResult>> upload_to_album(std::size_t limit,
                                                               upload::AssetSource& source,
                                                               const api::Album& album,
                                                               upload::ResultSink* progress = nullptr) const;

private:
    api::Session session_;
};

} // namespace immich
