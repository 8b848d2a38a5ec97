#include "immich/network/multipart.hpp"

#include <algorithm>

namespace immich::network {

namespace {

bool contains(const std::uint8_t* begin, const std::uint8_t* end, const std::string& needle) {
    return std::search(begin, end, needle.begin(), needle.end()) != end;
}

} // namespace

MultipartBuilder::MultipartBuilder(std::string boundary)
    : boundary_(std::move(boundary)) {}

std::string MultipartBuilder::boundary_for(const std::vector<std::uint8_t>& payload) {
    const auto* begin = payload.data();
    const auto* end = payload.data() + payload.size();

    std::string boundary = kDefaultBoundary;
    for (int suffix = 1; contains(begin, end, "--" + boundary); ++suffix) {
        boundary = std::string(kDefaultBoundary) + "-" + std::to_string(suffix);
    }
    return boundary;
}

MultipartBuilder& MultipartBuilder::add_text(const std::string& name, const std::string& text) {
    write_field_headers(name, std::nullopt, std::nullopt);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
    check_content(name, bytes, bytes + text.size());
    append(text);
    return *this;
}

MultipartBuilder& MultipartBuilder::add_bytes(const std::string& name,
                                              const std::vector<std::uint8_t>& bytes,
                                              const std::optional<std::string>& filename,
                                              const std::optional<std::string>& content_type) {
    write_field_headers(name, filename, content_type);
    check_content(name, bytes.data(), bytes.data() + bytes.size());
    inner_.insert(inner_.end(), bytes.begin(), bytes.end());
    return *this;
}

Result<MultipartBody> MultipartBuilder::finish() {
    if (data_written_) {
        append("\r\n");
    }
    append("--" + boundary_ + "--\r\n");

    MultipartBody body;
    body.content_type = "multipart/form-data; boundary=" + boundary_;
    body.data = std::move(inner_);
    inner_.clear();
    data_written_ = false;

    if (error_) {
        Error error = std::move(*error_);
        error_.reset();
        return Err<MultipartBody>(std::move(error));
    }
    return Ok(std::move(body));
}

void MultipartBuilder::write_boundary() {
    if (data_written_) {
        append("\r\n");
    }
    append("--" + boundary_ + "\r\n");
}

void MultipartBuilder::write_field_headers(const std::string& name,
                                           const std::optional<std::string>& filename,
                                           const std::optional<std::string>& content_type) {
    write_boundary();
    data_written_ = true;

    std::string headers = "Content-Disposition: form-data; name=" + quoted(name);
    if (filename) {
        headers += "; filename=" + quoted(*filename);
    }
    if (content_type) {
        if (content_type->find_first_of("\r\n") != std::string::npos) {
            fail("Line break in content type", name);
        }
        headers += "\r\nContent-Type: " + *content_type;
    }
    headers += "\r\n\r\n";
    append(headers);
}

void MultipartBuilder::check_content(const std::string& name,
                                     const std::uint8_t* begin,
                                     const std::uint8_t* end) {
    if (contains(begin, end, "--" + boundary_)) {
        fail("Part content contains the multipart boundary", name);
    }
}

std::string MultipartBuilder::quoted(const std::string& value) {
    std::string out = "\"";
    for (const char c : value) {
        if (c == '\r' || c == '\n') {
            fail("Line break in multipart header value", value);
            continue;
        }
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

void MultipartBuilder::append(const std::string& text) {
    inner_.insert(inner_.end(), text.begin(), text.end());
}

void MultipartBuilder::fail(std::string message, const std::string& subject) {
    if (!error_) {
        error_ = make_error(ErrorCode::InvalidConfig, std::move(message), subject);
    }
}

} // namespace immich::network
