#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace immich::util {

/**
 * @brief SHA-1 digest of an asset's bytes
 *
 * The server deduplicates uploads by this value, so it must match what the
 * server computes over the same file.
 */
class Checksum {
public:
    static constexpr std::size_t kSize = 20;
    using Digest = std::array<std::uint8_t, kSize>;

    Checksum() = default;
    explicit Checksum(const Digest& digest) : digest_(digest) {}

    static Checksum sha1(const std::uint8_t* data, std::size_t size);
    static Checksum sha1(const std::vector<std::uint8_t>& data) {
        return sha1(data.data(), data.size());
    }

    [[nodiscard]] const Digest& bytes() const noexcept { return digest_; }

    /**
     * @brief Lowercase hex, 40 characters
     */
    [[nodiscard]] std::string hex() const;

    bool operator==(const Checksum& other) const noexcept { return digest_ == other.digest_; }
    bool operator!=(const Checksum& other) const noexcept { return digest_ != other.digest_; }

private:
    Digest digest_{};
};

} // namespace immich::util
