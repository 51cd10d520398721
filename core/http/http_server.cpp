#include "http/http_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>

namespace vigil {

namespace {

constexpr auto kAcceptBackoff = std::chrono::milliseconds(100);

void set_io_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace

HttpServer::HttpServer(const std::string& host, int port, std::size_t threads,
                       Router& router, Logger& logger,
                       std::chrono::milliseconds io_timeout)
    : host_(host), port_(port), io_timeout_(io_timeout), router_(router),
      logger_(logger), connections_(threads, logger) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_.load()) {
        return;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw HttpError(std::string("socket: ") + std::strerror(errno));
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        ::close(server_fd_);
        server_fd_ = -1;
        throw HttpError("invalid listen address: " + host_);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(server_fd_, SOMAXCONN) < 0) {
        std::string reason = std::strerror(errno);
        ::close(server_fd_);
        server_fd_ = -1;
        throw HttpError("cannot listen on " + host_ + ":" + std::to_string(port_) +
                        ": " + reason);
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    running_ = true;
    thread_ = std::thread(&HttpServer::accept_loop, this);

    logger_.log_event(LogLevel::INFO, "server_started",
                      {{"host", host_}, {"port", port_}});
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (int fd : clients_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    connections_.shutdown();
    logger_.log_event(LogLevel::INFO, "server_stopped");
}

void HttpServer::accept_loop() {
    while (running_) {
        sockaddr_in client{};
        socklen_t len = sizeof(client);
        int client_fd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&client), &len);
        if (client_fd < 0) {
            int err = errno;
            if (!running_) {
                break;
            }
            if (err == EINTR || err == ECONNABORTED) {
                continue;
            }
            logger_.log_event(LogLevel::WARN, "accept_failed",
                              {{"error", std::strerror(err)}});
            std::this_thread::sleep_for(kAcceptBackoff);
            continue;
        }

        set_io_timeout(client_fd, io_timeout_);
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            clients_.insert(client_fd);
        }
        if (!connections_.submit("http_connection",
                                 [this, client_fd] { serve_connection(client_fd); })) {
            release_client(client_fd);
        }
    }
}

void HttpServer::release_client(int client_fd) {
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.erase(client_fd);
    }
    ::close(client_fd);
}

void HttpServer::serve_connection(int client_fd) {
    std::string raw;
    char buffer[4096];
    std::size_t expected = 0;
    bool have_head = false;
    bool timed_out = false;

    HttpResponse response;
    try {
        while (true) {
            ssize_t n = ::read(client_fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                timed_out = true;
                break;
            }
            if (n <= 0) {
                break;
            }
            raw.append(buffer, static_cast<std::size_t>(n));
            if (raw.size() > kMaxRequestBytes) {
                throw HttpError("request too large");
            }

            if (!have_head) {
                auto end = header_end(raw);
                if (end == std::string::npos) {
                    continue;
                }
                have_head = true;
                expected = end + content_length(raw.substr(0, end));
            }
            if (raw.size() >= expected) {
                break;
            }
        }

        if (!have_head) {
            if (timed_out) {
                logger_.log_event(LogLevel::DEBUG, "client_timed_out");
            }
            release_client(client_fd);
            return;
        }
        if (timed_out && raw.size() < expected) {
            throw HttpError("request timed out");
        }
        response = router_.handle(parse_request(raw.substr(0, expected)));
    } catch (const HttpError& e) {
        response = error_response(400, e.what());
    } catch (const std::exception& e) {
        logger_.log_event(LogLevel::ERROR, "request_failed", {{"error", e.what()}});
        response = error_response(500, "internal error");
    }

    const std::string out = response.serialize();
    std::size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = ::send(client_fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            logger_.log_event(LogLevel::DEBUG, "send_failed",
                              {{"error", std::strerror(errno)}});
            break;
        }
        sent += static_cast<std::size_t>(n);
    }
    release_client(client_fd);
}

} // namespace vigil
