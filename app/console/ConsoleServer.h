#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "ExecEndpoint.h"
#include "HttpMessage.h"

namespace ConsoleGate {

struct ConsoleServerOptions {
    std::string address{"127.0.0.1"};
    int port{7363};                          // 0 picks an ephemeral port
    size_t maxRequestBytes{1024 * 1024};
};

/**
 * @brief HTTP listener for the web console
 *
 * Routes:
 *   GET  /          built-in console page
 *   GET  /healthz   liveness ("ok")
 *   POST /api/exec  command execution (see ExecEndpoint)
 *
 * Each accepted connection is served on its own thread. While a command
 * runs, the client socket is polled for hangup and the subprocess is
 * killed if the browser goes away.
 */
class ConsoleServer {
public:
    ConsoleServer(ConsoleServerOptions options, ExecEndpoint& endpoint);
    ~ConsoleServer();

    // Disable copy
    ConsoleServer(const ConsoleServer&) = delete;
    ConsoleServer& operator=(const ConsoleServer&) = delete;

    bool start();

    /**
     * @brief Stop accepting and wait for in-flight requests to finish
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief Port actually bound (differs from options when port was 0)
     */
    int boundPort() const { return boundPort_; }

    /**
     * @brief Route one parsed request; exposed for tests
     */
    HttpResponse dispatch(const HttpRequest& request,
                          const SubprocessExecutor::CancelCheck& cancelled) const;

    /**
     * @brief True once the peer on fd has hung up or errored
     */
    static bool peerDisconnected(int fd);

private:
    void serverLoop();
    void handleClient(int clientSocket);
    void sendResponse(int clientSocket, const HttpResponse& response);
    void lingeringClose(int clientSocket);

    ConsoleServerOptions options_;
    ExecEndpoint& endpoint_;

    int serverSocket_{-1};
    int boundPort_{0};
    std::atomic<bool> running_{false};
    std::thread serverThread_;

    std::mutex handlersMutex_;
    std::condition_variable handlersDone_;
    size_t activeHandlers_{0};
};

} // namespace ConsoleGate
