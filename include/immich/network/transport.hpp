#pragma once

#include "immich/core/result.hpp"
#include "immich/network/http_types.hpp"

namespace immich::network {

/**
 * @brief One blocking request/response exchange with the server
 *
 * Implementations must be safe to call concurrently from several worker
 * threads. A non-2xx status is not an error at this level: only failures to
 * complete the exchange (DNS, connect, TLS, timeout) return ErrorCode::Transport.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace immich::network
