#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

#include "Result.h"

namespace ConsoleGate {

struct HttpRequest {
    std::string method;
    std::string path;                              // query string stripped
    std::map<std::string, std::string> headers;    // keys lower-cased
    std::string body;

    std::string header(const std::string& name, const std::string& fallback = "") const;
};

struct HttpResponse {
    int status{200};
    std::string contentType{"application/json"};
    std::string body;

    static const char* statusText(int status);

    /**
     * @brief Full HTTP/1.1 message with Content-Length and Connection: close
     */
    std::string serialize() const;
};

/**
 * @brief Minimal HTTP/1.1 request reading for the console socket
 *
 * One request per connection. Chunked bodies are not accepted; clients
 * must send Content-Length.
 */
class HttpRequestReader {
public:
    static constexpr size_t MAX_HEADER_BYTES = 64 * 1024;

    /**
     * @brief Parse the request line and headers (everything before the blank line)
     */
    static Result<HttpRequest> parseHead(const std::string& head);

    /**
     * @brief Read one request from a connected socket
     *
     * Fails with REQUEST_TOO_LARGE when the declared or received body
     * exceeds maxBodyBytes, and with INVALID_REQUEST_BODY on malformed
     * input, a short body, or when the peer stalls past idleTimeout.
     */
    static Result<HttpRequest> read(int fd, size_t maxBodyBytes,
                                    std::chrono::milliseconds idleTimeout = std::chrono::seconds(10));
};

} // namespace ConsoleGate
