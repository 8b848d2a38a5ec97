#pragma once

#include "immich/core/config.hpp"
#include "immich/core/result.hpp"
#include "immich/network/http_types.hpp"
#include "immich/network/transport.hpp"
#include "immich/network/url.hpp"

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace immich::api {

/**
 * @brief How requests prove who they are
 */
struct Credential {
    enum class Kind {
        AccessToken,  ///< Session token from /auth/login, sent as a cookie
        ApiKey        ///< User API key, sent as x-api-key
    };

    Kind kind = Kind::AccessToken;
    std::string value;

    [[nodiscard]] std::pair<std::string, std::string> header() const;
};

/**
 * @brief Authenticated, immutable handle to the server API
 *
 * A Session is built once by the caller and then shared read-only by every
 * worker of a batch upload; none of its methods mutate it.
 */
class Session {
public:
    Session(network::BaseUrl base_url,
            Credential credential,
            std::shared_ptr<network::Transport> transport,
            ClientConfig config = {});

    /**
     * @brief POST /auth/login with email and password
     *
     * A rejected login returns ErrorCode::Auth; an unreachable server
     * returns ErrorCode::Transport.
     */
    static Result<Session> login(std::shared_ptr<network::Transport> transport,
                                 std::string url,
                                 const std::string& email,
                                 const std::string& password,
                                 ClientConfig config = {});

    /**
     * @brief Use an API key, verified against /auth/validateToken
     */
    static Result<Session> with_api_key(std::shared_ptr<network::Transport> transport,
                                        std::string url,
                                        std::string key,
                                        ClientConfig config = {});

    /**
     * @brief Use a previously issued access token, verified the same way
     */
    static Result<Session> with_token(std::shared_ptr<network::Transport> transport,
                                      std::string url,
                                      std::string token,
                                      ClientConfig config = {});

    [[nodiscard]] const network::BaseUrl& base_url() const noexcept { return base_url_; }
    [[nodiscard]] const Credential& credential() const noexcept { return credential_; }
    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

    /**
     * @brief true when the server accepts the credential
     */
    Result<bool> validate() const;

    Result<network::HttpResponse> get(std::string_view path) const;

    Result<network::HttpResponse> post_json(std::string_view path, const nlohmann::json& body) const;

    Result<network::HttpResponse> put_json(std::string_view path, const nlohmann::json& body) const;

    /**
     * @brief Send an arbitrary pre-built request with auth and default headers added
     */
    Result<network::HttpResponse> send(network::HttpMethod method,
                                       std::string_view path,
                                       std::vector<uint8_t> body = {},
                                       const network::HeaderList& extra_headers = {}) const;

private:
    static Result<Session> verified(Session session);

    network::BaseUrl base_url_;
    Credential credential_;
    std::shared_ptr<network::Transport> transport_;
    ClientConfig config_;
};

/**
 * @brief Accept and User-Agent headers every request carries
 */
void add_default_headers(network::HttpRequest& request, const ClientConfig& config);

} // namespace immich::api
