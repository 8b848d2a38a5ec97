#include "immich/util/checksum.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace immich::util {

Checksum Checksum::sha1(const std::uint8_t* data, std::size_t size) {
    Digest digest{};
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest.data(), &length, EVP_sha1(), nullptr) != 1 || length != kSize) {
        throw std::runtime_error("SHA-1 digest computation failed");
    }
    return Checksum(digest);
}

std::string Checksum::hex() const {
    std::ostringstream oss;
    for (const unsigned char c : digest_) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

} // namespace immich::util
