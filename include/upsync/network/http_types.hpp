#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace upsync {
namespace network {

/**
 * @brief HTTP request methods used by the upload protocol
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes the ingest side produces and the transport classifies
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    PAYLOAD_TOO_LARGE = 413,
    UNPROCESSABLE_ENTITY = 422,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503
};

/// Case-insensitive header lookup; HTTP field names are case-insensitive per RFC 7230
inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.1";
    }
}

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief An HTTP/1.1 request
 *
 * Request-Line = Method SP Request-URI SP HTTP-Version CRLF
 * *(header-field CRLF) CRLF [ message-body ]
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                                      // request target, e.g. "/api/upload"
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const { return find_header(headers, name); }
    bool has_header(const std::string& name) const { return !get_header(name).empty(); }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    /// Sets Content-Length to match
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << url << " " << version_to_string(version) << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        std::string head = oss.str();
        std::vector<uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }
};

/**
 * @brief An HTTP/1.1 response
 *
 * Status-Line = HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 * *(header-field CRLF) CRLF [ message-body ]
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        std::string head = oss.str();
        std::vector<uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::UNAUTHORIZED: return "Unauthorized";
            case HttpStatus::FORBIDDEN: return "Forbidden";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::UNPROCESSABLE_ENTITY: return "Unprocessable Entity";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::BAD_GATEWAY: return "Bad Gateway";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }
};

} // namespace network
} // namespace upsync
