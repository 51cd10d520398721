#pragma once

#include "engine/worker_pool.h"
#include "http/router.h"
#include "logging/logger.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace vigil {

// Blocking HTTP/1.1 listener. One accept thread; each connection is served
// on the server's own worker pool and closed after a single response.
// Reads and writes on a client socket give up after io_timeout, so a silent
// client holds a worker for at most that long.
class HttpServer {
public:
    static constexpr std::size_t kMaxRequestBytes = 1 << 20;
    static constexpr std::chrono::milliseconds kDefaultIoTimeout{5000};

    HttpServer(const std::string& host, int port, std::size_t threads,
               Router& router, Logger& logger,
               std::chrono::milliseconds io_timeout = kDefaultIoTimeout);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts accepting. Throws HttpError if the socket cannot be
    // bound or listened on. Port 0 binds an ephemeral port; port() reports it.
    void start();
    // Stops accepting and shuts down open client sockets, then waits for
    // in-flight connections to finish.
    void stop();

    bool running() const { return running_.load(); }
    int port() const { return port_; }

private:
    void accept_loop();
    void serve_connection(int client_fd);
    void release_client(int client_fd);

    std::string host_;
    int port_;
    std::chrono::milliseconds io_timeout_;
    Router& router_;
    Logger& logger_;
    std::mutex clients_mutex_;
    std::set<int> clients_;
    WorkerPool connections_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    int server_fd_ = -1;
};

} // namespace vigil
