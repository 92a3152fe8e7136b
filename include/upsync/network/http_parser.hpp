#pragma once

#include "upsync/core/result.hpp"
#include "upsync/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace upsync {
namespace network {

/**
 * @brief Parser states, one per syntactic element of an HTTP/1.x message
 *
 * Request:  METHOD SP URL SP VERSION CRLF
 * Response: STATUS_VERSION SP STATUS_CODE SP REASON CRLF
 * Then:     (HEADER_NAME ":" HEADER_VALUE CRLF)* CRLF [body]
 *
 * The body is framed by Content-Length (BODY), chunked transfer coding
 * (CHUNK_*), or, for responses only, by the peer closing the connection
 * (BODY_UNTIL_CLOSE).
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    STATUS_VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    BODY_UNTIL_CLOSE,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    COMPLETE,
    PARSE_ERROR
};

enum class ParseMode {
    Request,
    Response
};

/**
 * @brief Incremental HTTP/1.x message parser
 *
 * Data can be fed in arbitrary chunks as it arrives from the socket:
 * ```cpp
 * HttpParser parser(ParseMode::Response);
 * auto done = parser.parse(buf.data(), n);
 * if (done.is_ok() && done.value()) {
 *     const HttpResponse& response = parser.get_response();
 * }
 * ```
 * Call finish() when the peer closes the connection; it completes a
 * close-delimited response body and fails for anything truncated.
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxLineLength = 16 * 1024;

    explicit HttpParser(ParseMode mode = ParseMode::Request);

    /**
     * @return true once a complete message has been parsed, false if more
     *         data is needed; ErrorKind::Protocol on malformed input
     */
    Result<bool> parse(const char* data, std::size_t len);

    /// Signal end of input
    Result<bool> finish();

    const HttpRequest& get_request() const { return request_; }
    const HttpResponse& get_response() const { return response_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    ParseState state() const { return state_; }

    void reset();

private:
    bool step(char c);
    std::size_t consume_body(const char* data, std::size_t len);

    bool parse_method(char c);
    bool parse_url(char c);
    bool parse_version(char c);
    bool parse_status_version(char c);
    bool parse_status_code(char c);
    bool parse_reason(char c);
    bool parse_header_name(char c);
    bool parse_header_value(char c);
    bool parse_chunk_size(char c);
    bool parse_chunk_data_end(char c);
    bool parse_chunk_trailer(char c);

    bool on_headers_complete();

    std::unordered_map<std::string, std::string>& headers();
    std::vector<uint8_t>& body();

    ParseMode mode_;
    ParseState state_ = ParseState::METHOD;
    HttpRequest request_;
    HttpResponse response_;
    std::string buffer_;                // current token
    std::string current_header_name_;
    std::size_t body_remaining_ = 0;    // bytes left in the Content-Length body or current chunk
    std::size_t line_ = 1;              // for error reporting
    bool last_char_was_cr_ = false;
};

} // namespace network
} // namespace upsync
