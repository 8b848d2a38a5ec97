#pragma once

#include <chrono>
#include <string>

namespace immich {

inline constexpr const char* kClientName = "Immich-0.1 (C++ Client)";

/**
 * @brief Client-wide settings shared by the session and its transport
 *
 * Timeouts of zero mean "no timeout": a stalled HTTP exchange then occupies
 * its worker until the server or the network gives up.
 */
struct ClientConfig {
    std::string device_id = kClientName;   ///< Sent as deviceId with every upload
    std::string user_agent = kClientName;
    std::chrono::seconds connect_timeout{0};
    std::chrono::seconds request_timeout{0};
    bool verify_tls = true;
};

} // namespace immich
