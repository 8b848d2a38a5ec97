#include "immich/api/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace immich::api {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

constexpr const char* kLoginPath = "/auth/login";
constexpr const char* kValidatePath = "/auth/validateToken";
constexpr const char* kJsonContentType = "application/json";

std::vector<uint8_t> to_bytes(const json& body) {
    const std::string text = body.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

std::pair<std::string, std::string> Credential::header() const {
    switch (kind) {
        case Kind::AccessToken: return {"Cookie", "immich_access_token=" + value};
        case Kind::ApiKey: return {"x-api-key", value};
    }
    return {"x-api-key", value};
}

void add_default_headers(HttpRequest& request, const ClientConfig& config) {
    request.set_header("Accept", "application/json");
    request.set_header("User-Agent", config.user_agent);
}

Session::Session(network::BaseUrl base_url,
                 Credential credential,
                 std::shared_ptr<network::Transport> transport,
                 ClientConfig config)
    : base_url_(std::move(base_url)),
      credential_(std::move(credential)),
      transport_(std::move(transport)),
      config_(std::move(config)) {}

Result<Session> Session::login(std::shared_ptr<network::Transport> transport,
                               std::string url,
                               const std::string& email,
                               const std::string& password,
                               ClientConfig config) {
    auto base = network::BaseUrl::parse(std::move(url));
    if (base.is_error()) {
        return Err<Session>(base.error());
    }

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = base.value().join(kLoginPath);
    add_default_headers(request, config);
    request.set_header("Content-Type", kJsonContentType);
    request.body = to_bytes(json{{"email", email}, {"password", password}});

    auto sent = transport->send(request);
    if (sent.is_error()) {
        spdlog::error("Login request to {} failed: {}", base.value().str(), sent.error().to_string());
        return Err<Session>(sent.error());
    }

    const HttpResponse& response = sent.value();
    if (!response.has_status(HttpStatus::CREATED)) {
        spdlog::error("Login rejected by {}: HTTP {}", base.value().str(), response.status_code);
        Error error = make_error(ErrorCode::Auth, "Unable to authenticate: " + response.body_as_string());
        error.http_status = response.status_code;
        return Err<Session>(error);
    }

    std::string token;
    try {
        token = json::parse(response.body_as_string()).at("accessToken").get<std::string>();
    } catch (const json::exception& e) {
        return Err<Session>(make_error(ErrorCode::Protocol, std::string("Invalid login response: ") + e.what()));
    }

    spdlog::info("Logged in to {} as {}", base.value().str(), email);
    return Ok(Session(std::move(base.value()),
                      Credential{Credential::Kind::AccessToken, std::move(token)},
                      std::move(transport),
                      std::move(config)));
}

Result<Session> Session::with_api_key(std::shared_ptr<network::Transport> transport,
                                      std::string url,
                                      std::string key,
                                      ClientConfig config) {
    auto base = network::BaseUrl::parse(std::move(url));
    if (base.is_error()) {
        return Err<Session>(base.error());
    }
    return verified(Session(std::move(base.value()),
                            Credential{Credential::Kind::ApiKey, std::move(key)},
                            std::move(transport),
                            std::move(config)));
}

Result<Session> Session::with_token(std::shared_ptr<network::Transport> transport,
                                    std::string url,
                                    std::string token,
                                    ClientConfig config) {
    auto base = network::BaseUrl::parse(std::move(url));
    if (base.is_error()) {
        return Err<Session>(base.error());
    }
    return verified(Session(std::move(base.value()),
                            Credential{Credential::Kind::AccessToken, std::move(token)},
                            std::move(transport),
                            std::move(config)));
}

Result<Session> Session::verified(Session session) {
    auto valid = session.validate();
    if (valid.is_error()) {
        return Err<Session>(valid.error());
    }
    if (!valid.value()) {
        spdlog::error("Credential rejected by {}", session.base_url().str());
        return Err<Session>(make_error(ErrorCode::Auth, "Unable to authenticate or authentication expired"));
    }
    spdlog::info("Connected to {}", session.base_url().str());
    return Ok(std::move(session));
}

Result<bool> Session::validate() const {
    auto sent = send(HttpMethod::POST, kValidatePath);
    if (sent.is_error()) {
        return Err<bool>(sent.error());
    }
    return Ok(sent.value().has_status(HttpStatus::OK));
}

Result<HttpResponse> Session::get(std::string_view path) const {
    return send(HttpMethod::GET, path);
}

Result<HttpResponse> Session::post_json(std::string_view path, const json& body) const {
    return send(HttpMethod::POST, path, to_bytes(body), {{"Content-Type", kJsonContentType}});
}

Result<HttpResponse> Session::put_json(std::string_view path, const json& body) const {
    return send(HttpMethod::PUT, path, to_bytes(body), {{"Content-Type", kJsonContentType}});
}

Result<HttpResponse> Session::send(HttpMethod method,
                                   std::string_view path,
                                   std::vector<uint8_t> body,
                                   const network::HeaderList& extra_headers) const {
    HttpRequest request;
    request.method = method;
    request.url = base_url_.join(path);
    add_default_headers(request, config_);
    for (const auto& [name, value] : extra_headers) {
        request.set_header(name, value);
    }
    const auto [auth_name, auth_value] = credential_.header();
    request.set_header(auth_name, auth_value);
    request.body = std::move(body);

    return transport_->send(request);
}

} // namespace immich::api
