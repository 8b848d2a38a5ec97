#include "immich/client/client.hpp"

#include "immich/network/curl_transport.hpp"

#include <spdlog/spdlog.h>

#include <iterator>
#include <memory>

namespace immich {

namespace {

Result<Client> wrap(Result<api::Session> session) {
    if (session.is_error()) {
        return Err<Client>(session.error());
    }
    return Ok(Client(std::move(session.value())));
}

std::shared_ptr<network::Transport> make_transport(const ClientConfig& config) {
    return std::make_shared<network::CurlTransport>(config);
}

} // namespace

Client::Client(api::Session session) : session_(std::move(session)) {}

Result<Client> Client::login(std::string url,
                             const std::string& email,
                             const std::string& password,
                             ClientConfig config) {
    auto transport = make_transport(config);
    return wrap(api::Session::login(std::move(transport), std::move(url), email, password, std::move(config)));
}

Result<Client> Client::with_api_key(std::string url, std::string key, ClientConfig config) {
    auto transport = make_transport(config);
    return wrap(api::Session::with_api_key(std::move(transport), std::move(url), std::move(key), std::move(config)));
}

Result<Client> Client::with_token(std::string url, std::string token, ClientConfig config) {
    auto transport = make_transport(config);
    return wrap(api::Session::with_token(std::move(transport), std::move(url), std::move(token), std::move(config)));
}

Result<std::vector<api::Album>> Client::albums() const {
    return api::list_albums(session_);
}

Result<api::Album> Client::get_or_create_album(const std::string& name) const {
    return api::get_or_create_album(session_, name);
}

api::UploadOutcome Client::upload(const asset::Asset& asset) const {
    return api::upload_asset(session_, asset);
}

Result<std::vector<api::RemoteCheck>> Client::bulk_check(const std::vector<asset::Asset>& assets) const {
    return api::bulk_upload_check(session_, assets);
}

Result<BatchResult> Client::parallel_upload(std::size_t limit, upload::AssetSource& source) const {
    upload::CollectingSink sink;
    auto summary = parallel_upload_with_progress(limit, source, sink);
    if (summary.is_error()) {
        return Err<BatchResult>(summary.error());
    }

    BatchResult batch;
    batch.outcomes = sink.take();
    batch.summary = summary.value();
    return Ok(std::move(batch));
}

Result<upload::RunSummary> Client::parallel_upload_with_progress(std::size_t limit,
                                                                 upload::AssetSource& source,
                                                                 upload::ResultSink& sink,
                                                                 upload::EngineOptions options) const {
    api::SessionUploader uploader(session_);
    upload::ParallelUploadEngine engine(uploader, std::move(options));
    return engine.run(limit, source, sink);
}

Result<std::vector<api::AlbumAssetResult>> Client::upload_to_album(std::size_t limit,
                                                                   upload::AssetSource& source,
                                                                   const api::Album& album,
                                                                   upload::ResultSink* progress) const {
    using Results = std::vector<api::AlbumAssetResult>;

    upload::CollectingSink collected;
    upload::TeeSink sink(collected, progress);
    auto summary = parallel_upload_with_progress(limit, source, sink);
    if (summary.is_error()) {
        return Err<Results>(summary.error());
    }

    std::vector<std::string> ids;
    Results failures;
    for (const auto& outcome : collected.take()) {
        if (outcome.ok()) {
            ids.push_back(*outcome.remote_id());
        } else {
            api::AlbumAssetResult failure;
            failure.id = outcome.device_asset_id();
            failure.error = outcome.error() ? outcome.error()->to_string() : "upload failed";
            failures.push_back(std::move(failure));
        }
    }

    Results results;
    if (!ids.empty()) {
        auto added = api::add_assets_to_album(session_, album.id, ids);
        if (added.is_error()) {
            return Err<Results>(added.error());
        }
        results = std::move(added.value());
    } else {
        spdlog::info("Nothing uploaded, album '{}' left unchanged", album.name);
    }

    results.insert(results.end(),
                   std::make_move_iterator(failures.begin()),
                   std::make_move_iterator(failures.end()));
    return Ok(std::move(results));
}

} // namespace immich
