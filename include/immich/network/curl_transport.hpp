#pragma once

#include "immich/core/config.hpp"
#include "immich/network/transport.hpp"

namespace immich::network {

/**
 * @brief Transport backed by libcurl's easy interface
 *
 * Every send() uses its own easy handle, so one CurlTransport can be shared
 * by all upload workers without locking.
 */
class CurlTransport : public Transport {
public:
    explicit CurlTransport(ClientConfig config = {});

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    ClientConfig config_;
};

/**
 * @brief curl_global_init exactly once per process
 */
void ensure_curl_global_init();

} // namespace immich::network
