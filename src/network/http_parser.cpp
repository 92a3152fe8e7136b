#include "upsync/network/http_parser.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace upsync {
namespace network {
namespace {

bool parse_decimal(const std::string& text, std::size_t& out) {
    if (text.empty()) {
        return false;
    }
    std::size_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        const std::size_t digit = static_cast<std::size_t>(c - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

bool parse_hex(const std::string& text, std::size_t& out) {
    if (text.empty() || text.size() > sizeof(std::size_t) * 2) {
        return false;
    }
    std::size_t value = 0;
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        const int digit = std::isdigit(static_cast<unsigned char>(c))
            ? c - '0'
            : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        value = (value << 4) | static_cast<std::size_t>(digit);
    }
    out = value;
    return true;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

bool contains_token(const std::string& value, const std::string& token) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find(token) != std::string::npos;
}

const char* describe_state(ParseState state) {
    switch (state) {
        case ParseState::METHOD: return "method";
        case ParseState::URL: return "URL";
        case ParseState::VERSION: return "version";
        case ParseState::STATUS_VERSION: return "status line version";
        case ParseState::STATUS_CODE: return "status code";
        case ParseState::REASON: return "reason phrase";
        case ParseState::HEADER_NAME: return "header name";
        case ParseState::HEADER_VALUE: return "header value";
        case ParseState::CHUNK_SIZE: return "chunk size";
        case ParseState::CHUNK_DATA_END: return "chunk terminator";
        case ParseState::CHUNK_TRAILER: return "chunk trailer";
        default: return "message";
    }
}

} // namespace

HttpParser::HttpParser(ParseMode mode) : mode_(mode) {
    reset();
}

void HttpParser::reset() {
    state_ = mode_ == ParseMode::Request ? ParseState::METHOD : ParseState::STATUS_VERSION;
    request_ = HttpRequest();
    response_ = HttpResponse();
    buffer_.clear();
    current_header_name_.clear();
    body_remaining_ = 0;
    line_ = 1;
    last_char_was_cr_ = false;
}

Result<bool> HttpParser::parse(const char* data, std::size_t len) {
    std::size_t i = 0;
    while (i < len) {
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ParseState::PARSE_ERROR) {
            return Err<bool>(ErrorKind::Protocol, "Parser in error state");
        }

        if (state_ == ParseState::BODY || state_ == ParseState::CHUNK_DATA ||
            state_ == ParseState::BODY_UNTIL_CLOSE) {
            i += consume_body(data + i, len - i);
            continue;
        }

        const char c = data[i++];
        if (c == '\n') {
            line_++;
        }

        const ParseState failed_in = state_;
        if (!step(c)) {
            state_ = ParseState::PARSE_ERROR;
            return Err<bool>(ErrorKind::Protocol,
                             std::string("Failed to parse ") + describe_state(failed_in) +
                                 " at line " + std::to_string(line_));
        }
        if (buffer_.size() > kMaxLineLength) {
            state_ = ParseState::PARSE_ERROR;
            return Err<bool>(ErrorKind::Protocol, "Line too long at line " + std::to_string(line_));
        }
    }
    return Ok(state_ == ParseState::COMPLETE);
}

Result<bool> HttpParser::finish() {
    if (state_ == ParseState::COMPLETE) {
        return Ok(true);
    }
    if (state_ == ParseState::BODY_UNTIL_CLOSE) {
        state_ = ParseState::COMPLETE;
        return Ok(true);
    }
    return Err<bool>(ErrorKind::Protocol, "Connection closed before the message was complete");
}

bool HttpParser::step(char c) {
    switch (state_) {
        case ParseState::METHOD: return parse_method(c);
        case ParseState::URL: return parse_url(c);
        case ParseState::VERSION: return parse_version(c);
        case ParseState::STATUS_VERSION: return parse_status_version(c);
        case ParseState::STATUS_CODE: return parse_status_code(c);
        case ParseState::REASON: return parse_reason(c);
        case ParseState::HEADER_NAME: return parse_header_name(c);
        case ParseState::HEADER_VALUE: return parse_header_value(c);
        case ParseState::CHUNK_SIZE: return parse_chunk_size(c);
        case ParseState::CHUNK_DATA_END: return parse_chunk_data_end(c);
        case ParseState::CHUNK_TRAILER: return parse_chunk_trailer(c);
        default: return false;
    }
}

std::size_t HttpParser::consume_body(const char* data, std::size_t len) {
    auto& target = body();
    const auto* bytes = reinterpret_cast<const uint8_t*>(data);

    if (state_ == ParseState::BODY_UNTIL_CLOSE) {
        target.insert(target.end(), bytes, bytes + len);
        return len;
    }

    const std::size_t take = std::min(len, body_remaining_);
    target.insert(target.end(), bytes, bytes + take);
    body_remaining_ -= take;
    if (body_remaining_ == 0) {
        state_ = state_ == ParseState::BODY ? ParseState::COMPLETE : ParseState::CHUNK_DATA_END;
    }
    return take;
}

// ──────────────────────────────────────────────────────────
// Request line
// ──────────────────────────────────────────────────────────

bool HttpParser::parse_method(char c) {
    if (c == ' ') {
        if (buffer_.empty()) {
            return false;
        }
        request_.method = HttpMethodUtils::from_string(buffer_);
        if (request_.method == HttpMethod::UNKNOWN) {
            return false;
        }
        buffer_.clear();
        state_ = ParseState::URL;
        return true;
    }

    if (!std::isupper(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_url(char c) {
    if (c == ' ') {
        if (buffer_.empty()) {
            return false;
        }
        request_.url = buffer_;
        buffer_.clear();
        state_ = ParseState::VERSION;
        return true;
    }

    if (!std::isprint(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_version(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        if (buffer_ == "HTTP/1.1") {
            request_.version = HttpVersion::HTTP_1_1;
        } else if (buffer_ == "HTTP/1.0") {
            request_.version = HttpVersion::HTTP_1_0;
        } else {
            return false;
        }
        buffer_.clear();
        last_char_was_cr_ = false;
        state_ = ParseState::HEADER_NAME;
        return true;
    }

    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

// ──────────────────────────────────────────────────────────
// Status line
// ──────────────────────────────────────────────────────────

bool HttpParser::parse_status_version(char c) {
    if (c == ' ') {
        if (buffer_ == "HTTP/1.1") {
            response_.version = HttpVersion::HTTP_1_1;
        } else if (buffer_ == "HTTP/1.0") {
            response_.version = HttpVersion::HTTP_1_0;
        } else {
            return false;
        }
        buffer_.clear();
        state_ = ParseState::STATUS_CODE;
        return true;
    }

    if (!std::isprint(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_status_code(char c) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
        buffer_ += c;
        return buffer_.size() <= 3;
    }

    if (c != ' ' && c != '\r') {
        return false;
    }
    if (buffer_.size() != 3) {
        return false;
    }
    response_.status_code = std::stoi(buffer_);
    buffer_.clear();
    last_char_was_cr_ = c == '\r';
    state_ = ParseState::REASON;
    return true;
}

bool HttpParser::parse_reason(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        response_.reason_phrase = buffer_;
        buffer_.clear();
        last_char_was_cr_ = false;
        state_ = ParseState::HEADER_NAME;
        return true;
    }

    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

// ──────────────────────────────────────────────────────────
// Headers
// ──────────────────────────────────────────────────────────

bool HttpParser::parse_header_name(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        if (!buffer_.empty()) {
            return false;  // header name without a colon
        }
        return on_headers_complete();
    }

    last_char_was_cr_ = false;

    if (c == ':') {
        if (buffer_.empty()) {
            return false;
        }
        current_header_name_ = buffer_;
        buffer_.clear();
        state_ = ParseState::HEADER_VALUE;
        return true;
    }

    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_header_value(char c) {
    if (buffer_.empty() && (c == ' ' || c == '\t')) {
        return true;
    }

    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        headers()[current_header_name_] = trim(buffer_);
        buffer_.clear();
        current_header_name_.clear();
        last_char_was_cr_ = false;
        state_ = ParseState::HEADER_NAME;
        return true;
    }

    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpParser::on_headers_complete() {
    const auto& fields = headers();

    if (mode_ == ParseMode::Response) {
        const int code = response_.status_code;
        if ((code >= 100 && code < 200) || code == 204 || code == 304) {
            state_ = ParseState::COMPLETE;
            return true;
        }
    }

    if (contains_token(find_header(fields, "Transfer-Encoding"), "chunked")) {
        state_ = ParseState::CHUNK_SIZE;
        return true;
    }

    const std::string content_length = find_header(fields, "Content-Length");
    if (!content_length.empty()) {
        std::size_t length = 0;
        if (!parse_decimal(content_length, length)) {
            return false;
        }
        if (length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        body().reserve(length);
        body_remaining_ = length;
        state_ = ParseState::BODY;
        return true;
    }

    state_ = mode_ == ParseMode::Response ? ParseState::BODY_UNTIL_CLOSE : ParseState::COMPLETE;
    return true;
}

// ──────────────────────────────────────────────────────────
// Chunked transfer coding (RFC 7230 section 4.1)
// ──────────────────────────────────────────────────────────

bool HttpParser::parse_chunk_size(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        // chunk extensions are ignored
        const std::string digits = trim(buffer_.substr(0, buffer_.find(';')));
        buffer_.clear();
        std::size_t size = 0;
        if (!parse_hex(digits, size)) {
            return false;
        }
        if (size == 0) {
            state_ = ParseState::CHUNK_TRAILER;
        } else {
            body_remaining_ = size;
            state_ = ParseState::CHUNK_DATA;
        }
        return true;
    }

    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpParser::parse_chunk_data_end(char c) {
    if (c == '\r' && !last_char_was_cr_) {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        state_ = ParseState::CHUNK_SIZE;
        return true;
    }
    return false;
}

bool HttpParser::parse_chunk_trailer(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        if (buffer_.empty()) {
            state_ = ParseState::COMPLETE;
        }
        buffer_.clear();
        return true;
    }

    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

std::unordered_map<std::string, std::string>& HttpParser::headers() {
    return mode_ == ParseMode::Request ? request_.headers : response_.headers;
}

std::vector<uint8_t>& HttpParser::body() {
    return mode_ == ParseMode::Request ? request_.body : response_.body;
}

} // namespace network
} // namespace upsync
