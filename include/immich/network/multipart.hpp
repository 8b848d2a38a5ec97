#pragma once

#include "immich/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace immich::network {

struct MultipartBody {
    std::string content_type;          ///< "multipart/form-data; boundary=..."
    std::vector<std::uint8_t> data;
};

/**
 * @brief Incremental multipart/form-data (RFC 7578) encoder
 *
 * Fields are written in call order. finish() always emits the closing
 * boundary, even when no field was added.
 *
 * Field names and file names are written as quoted strings with '"' and '\'
 * backslash-escaped. A name holding CR or LF, or a part whose content
 * contains the delimiter line, makes finish() fail with
 * ErrorCode::InvalidConfig instead of producing a malformed body.
 */
class MultipartBuilder {
public:
    static constexpr const char* kDefaultBoundary = "IMMICHCLIENTMULTIPARTUPLOADBOUND";

    explicit MultipartBuilder(std::string boundary = kDefaultBoundary);

    /**
     * @brief kDefaultBoundary, or a suffixed variant of it absent from payload
     */
    static std::string boundary_for(const std::vector<std::uint8_t>& payload);

    MultipartBuilder& add_text(const std::string& name, const std::string& text);

    MultipartBuilder& add_bytes(const std::string& name,
                                const std::vector<std::uint8_t>& bytes,
                                const std::optional<std::string>& filename = std::nullopt,
                                const std::optional<std::string>& content_type = std::nullopt);

    Result<MultipartBody> finish();

    [[nodiscard]] const std::string& boundary() const noexcept { return boundary_; }

private:
    void write_boundary();
    void write_field_headers(const std::string& name,
                             const std::optional<std::string>& filename,
                             const std::optional<std::string>& content_type);
    void check_content(const std::string& name, const std::uint8_t* begin, const std::uint8_t* end);
    std::string quoted(const std::string& value);
    void append(const std::string& text);
    void fail(std::string message, const std::string& subject);

    std::string boundary_;
    std::vector<std::uint8_t> inner_;
    bool data_written_ = false;
    std::optional<Error> error_;
};

} // namespace immich::network
