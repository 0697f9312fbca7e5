#include "ConsoleServer.h"
#include "ConsolePage.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace ConsoleGate {

namespace {
    const char* const COMPONENT = "ConsoleServer";
    constexpr int ACCEPT_POLL_MS = 250;
    constexpr int LISTEN_BACKLOG = 16;
    constexpr int LINGER_POLL_MS = 200;
    constexpr size_t LINGER_MAX_BYTES = 2 * 1024 * 1024;
}

ConsoleServer::ConsoleServer(ConsoleServerOptions options, ExecEndpoint& endpoint)
    : options_(std::move(options)), endpoint_(endpoint) {
}

ConsoleServer::~ConsoleServer() {
    stop();
}

bool ConsoleServer::start() {
    if (running_) return true;
    if (options_.port < 0 || options_.port > 65535) {
        Logger::instance().error("Invalid port " + std::to_string(options_.port), COMPONENT);
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(options_.port));
    if (::inet_pton(AF_INET, options_.address.c_str(), &addr.sin_addr) != 1) {
        Logger::instance().error("Invalid listen address: " + options_.address, COMPONENT);
        return false;
    }

    serverSocket_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (serverSocket_ < 0) {
        Logger::instance().error("Failed to create socket: " + std::string(std::strerror(errno)), COMPONENT);
        return false;
    }

    int opt = 1;
    if (setsockopt(serverSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        Logger::instance().error("Failed to set socket options: " + std::string(std::strerror(errno)), COMPONENT);
        ::close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    if (bind(serverSocket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        Logger::instance().error("Failed to bind " + options_.address + ":" + std::to_string(options_.port) +
                                 ": " + std::strerror(errno), COMPONENT);
        ::close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    if (listen(serverSocket_, LISTEN_BACKLOG) < 0) {
        Logger::instance().error("Failed to listen: " + std::string(std::strerror(errno)), COMPONENT);
        ::close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(serverSocket_, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = options_.port;
    }

    running_ = true;
    serverThread_ = std::thread(&ConsoleServer::serverLoop, this);
    Logger::instance().info("Console listening on http://" + options_.address + ":" + std::to_string(boundPort_),
                            COMPONENT);
    return true;
}

void ConsoleServer::stop() {
    if (!running_) return;
    running_ = false;

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    if (serverSocket_ >= 0) {
        ::close(serverSocket_);
        serverSocket_ = -1;
    }

    // Handlers are bounded by the exec timeout, so this wait is bounded too.
    std::unique_lock<std::mutex> lock(handlersMutex_);
    handlersDone_.wait(lock, [this] { return activeHandlers_ == 0; });
    Logger::instance().info("Console stopped", COMPONENT);
}

void ConsoleServer::serverLoop() {
    while (running_) {
        pollfd pfd{};
        pfd.fd = serverSocket_;
        pfd.events = POLLIN;

        int activity = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (activity <= 0) continue;

        int clientSocket = ::accept4(serverSocket_, nullptr, nullptr, SOCK_CLOEXEC);
        if (clientSocket < 0) {
            if (running_ && errno != EINTR && errno != ECONNABORTED) {
                Logger::instance().error("accept failed: " + std::string(std::strerror(errno)), COMPONENT);
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            ++activeHandlers_;
        }

        std::thread([this, clientSocket]() {
            handleClient(clientSocket);
            ::close(clientSocket);

            std::lock_guard<std::mutex> lock(handlersMutex_);
            if (--activeHandlers_ == 0) {
                handlersDone_.notify_all();
            }
        }).detach();
    }
}

bool ConsoleServer::peerDisconnected(int fd) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLRDHUP;
    int rc = ::poll(&pfd, 1, 0);
    if (rc < 0) {
        return errno != EINTR;
    }
    return rc > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL));
}

HttpResponse ConsoleServer::dispatch(const HttpRequest& request,
                                     const SubprocessExecutor::CancelCheck& cancelled) const {
    if (request.path == "/api/exec") {
        return endpoint_.handle(request.method, request.body, cancelled);
    }

    HttpResponse response;
    response.contentType = "text/plain; charset=utf-8";

    if (request.path == "/healthz") {
        response.body = "ok\n";
    } else if (request.path == "/" || request.path == "/index.html") {
        if (request.method != "GET" && request.method != "HEAD") {
            response.status = 405;
            response.body = "Method Not Allowed\n";
        } else {
            response.contentType = "text/html; charset=utf-8";
            response.body = consolePageHtml();
        }
    } else {
        response.status = 404;
        response.body = "Not Found\n";
    }
    return response;
}

void ConsoleServer::handleClient(int clientSocket) {
    HttpResponse response;
    try {
        auto request = HttpRequestReader::read(clientSocket, options_.maxRequestBytes);
        if (request.isError()) {
            const auto& err = request.error();
            LOG_DEBUG_COMP_IF("Bad request: " + err.message, COMPONENT);
            if (err.is(Core::toInt(Core::ErrorCode::REQUEST_TOO_LARGE))) {
                response = ExecEndpoint::errorResponse(413, Core::ErrorCode::REQUEST_TOO_LARGE);
            } else {
                response = ExecEndpoint::errorResponse(400, Core::ErrorCode::INVALID_REQUEST_BODY);
            }
        } else {
            const HttpRequest& req = request.value();
            LOG_DEBUG_COMP_IF(req.method + " " + req.path, COMPONENT);
            response = dispatch(req, [clientSocket]() { return peerDisconnected(clientSocket); });
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Request handling failed: " + std::string(e.what()), COMPONENT);
        response = ExecEndpoint::errorResponse(500, Core::ErrorCode::INTERNAL_ERROR);
    }

    sendResponse(clientSocket, response);
    lingeringClose(clientSocket);
}

void ConsoleServer::lingeringClose(int clientSocket) {
    // Unread request bytes at close() turn into a RST that can destroy the
    // response in flight (413 replies are sent before the body is read).
    ::shutdown(clientSocket, SHUT_WR);

    char discard[4096];
    size_t drained = 0;
    while (drained < LINGER_MAX_BYTES) {
        pollfd pfd{};
        pfd.fd = clientSocket;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, LINGER_POLL_MS) <= 0) {
            return;
        }
        ssize_t n = ::recv(clientSocket, discard, sizeof(discard), 0);
        if (n <= 0) {
            return;
        }
        drained += static_cast<size_t>(n);
    }
}

void ConsoleServer::sendResponse(int clientSocket, const HttpResponse& response) {
    std::string wire = response.serialize();
    size_t sent = 0;
    while (sent < wire.size()) {
        ssize_t n = ::send(clientSocket, wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            LOG_DEBUG_COMP_IF("Client went away before the response was sent", COMPONENT);
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace ConsoleGate
