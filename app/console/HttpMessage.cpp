#include "HttpMessage.h"
#include "ErrorCodes.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>

namespace ConsoleGate {

namespace {

    const char* const COMPONENT = "ConsoleServer";
    const std::string HEAD_TERMINATOR = "\r\n\r\n";

    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string trimField(const std::string& text) {
        size_t start = text.find_first_not_of(" \t");
        if (start == std::string::npos) return "";
        size_t end = text.find_last_not_of(" \t\r");
        return text.substr(start, end - start + 1);
    }

    Error malformed(const std::string& what) {
        auto err = Core::ErrorRegistry::createError(Core::ErrorCode::INVALID_REQUEST_BODY, COMPONENT);
        err.message += ": " + what;
        return err;
    }

    // Waits for readability; false on timeout, error or hangup without data.
    bool waitReadable(int fd, std::chrono::milliseconds timeout) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int rc;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (rc < 0 && errno == EINTR);
        return rc > 0 && (pfd.revents & (POLLIN | POLLHUP));
    }

}

std::string HttpRequest::header(const std::string& name, const std::string& fallback) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : fallback;
}

const char* HttpResponse::statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpResponse::serialize() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << status << ' ' << statusText(status) << "\r\n"
       << "Content-Type: " << contentType << "\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Cache-Control: no-store\r\n"
       << "X-Content-Type-Options: nosniff\r\n"
       << "Connection: close\r\n\r\n"
       << body;
    return ss.str();
}

Result<HttpRequest> HttpRequestReader::parseHead(const std::string& head) {
    std::istringstream stream(head);
    std::string requestLine;
    if (!std::getline(stream, requestLine)) {
        return malformed("missing request line");
    }
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    HttpRequest request;
    std::istringstream parts(requestLine);
    std::string target;
    std::string version;
    if (!(parts >> request.method >> target >> version) || version.compare(0, 5, "HTTP/") != 0) {
        return malformed("bad request line");
    }

    size_t query = target.find('?');
    request.path = query == std::string::npos ? target : target.substr(0, query);

    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return malformed("bad header line");
        }
        request.headers[toLower(trimField(line.substr(0, colon)))] = trimField(line.substr(colon + 1));
    }

    return request;
}

Result<HttpRequest> HttpRequestReader::read(int fd, size_t maxBodyBytes, std::chrono::milliseconds idleTimeout) {
    std::string buffer;
    char chunk[4096];

    size_t headEnd = std::string::npos;
    while (headEnd == std::string::npos) {
        if (buffer.size() > MAX_HEADER_BYTES) {
            return malformed("headers too large");
        }
        if (!waitReadable(fd, idleTimeout)) {
            return malformed("timed out reading headers");
        }
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return malformed("connection closed before headers");
        }
        buffer.append(chunk, static_cast<size_t>(n));
        headEnd = buffer.find(HEAD_TERMINATOR);
    }

    auto parsed = parseHead(buffer.substr(0, headEnd));
    if (parsed.isError()) {
        return parsed;
    }
    HttpRequest request = std::move(parsed.value());

    if (!request.header("transfer-encoding").empty()) {
        return malformed("chunked bodies are not supported");
    }

    size_t contentLength = 0;
    std::string lengthText = request.header("content-length");
    if (!lengthText.empty()) {
        if (!std::all_of(lengthText.begin(), lengthText.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; }) ||
            lengthText.size() > 18) {
            return malformed("bad Content-Length");
        }
        contentLength = static_cast<size_t>(std::stoull(lengthText));
    }

    if (contentLength > maxBodyBytes) {
        return Core::ErrorRegistry::createError(Core::ErrorCode::REQUEST_TOO_LARGE, COMPONENT);
    }

    request.body = buffer.substr(headEnd + HEAD_TERMINATOR.size());
    if (request.body.size() > contentLength) {
        // Pipelined bytes past the declared body are ignored.
        request.body.resize(contentLength);
    }

    while (request.body.size() < contentLength) {
        if (!waitReadable(fd, idleTimeout)) {
            return malformed("timed out reading body");
        }
        size_t want = std::min(sizeof(chunk), contentLength - request.body.size());
        ssize_t n = ::recv(fd, chunk, want, 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return malformed("connection closed before body");
        }
        request.body.append(chunk, static_cast<size_t>(n));
    }

    return request;
}

} // namespace ConsoleGate
