#include "port_probe.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {
    // Closes the descriptor on scope exit
    class SocketGuard {
    public:
        explicit SocketGuard(int fd) : fd_(fd) {}
        ~SocketGuard() {
            if (fd_ >= 0) ::close(fd_);
        }
        int get() const { return fd_; }

        SocketGuard(const SocketGuard&) = delete;
        SocketGuard& operator=(const SocketGuard&) = delete;

    private:
        int fd_;
    };

    // Returns an empty string on success, otherwise the failure reason
    std::string try_connect(const addrinfo* addr, std::chrono::steady_clock::time_point deadline) {
        SocketGuard sock(::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol));
        if (sock.get() < 0) {
            return std::string("socket: ") + std::strerror(errno);
        }

        int flags = ::fcntl(sock.get(), F_GETFL, 0);
        if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
            return std::string("fcntl: ") + std::strerror(errno);
        }

        int rc = ::connect(sock.get(), addr->ai_addr, addr->ai_addrlen);
        if (rc == 0) {
            return {};
        }
        if (errno != EINPROGRESS) {
            return std::strerror(errno);
        }

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return "connection timed out";
            }

            pollfd pfd{};
            pfd.fd = sock.get();
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0) {
                if (errno == EINTR) continue;
                return std::string("poll: ") + std::strerror(errno);
            }
            if (rc == 0) {
                return "connection timed out";
            }
            break;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            return std::string("getsockopt: ") + std::strerror(errno);
        }
        if (so_error != 0) {
            return std::strerror(so_error);
        }
        return {};
    }
}

ConnectResult PosixTcpConnector::connect(const std::string& host, int port, std::chrono::milliseconds timeout) {
    ConnectResult result;
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    auto service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &addresses);
    if (rc != 0) {
        result.error = fmt::format("cannot resolve {}: {}", host, ::gai_strerror(rc));
        result.elapsed_ms = elapsed_ms(started);
        return result;
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(addresses, &::freeaddrinfo);

    std::string last_error = "no usable address";
    for (const addrinfo* addr = addresses; addr != nullptr; addr = addr->ai_next) {
        auto error = try_connect(addr, deadline);
        if (error.empty()) {
            result.connected = true;
            break;
        }
        last_error = error;
        if (std::chrono::steady_clock::now() >= deadline) break;
    }

    if (!result.connected) {
        result.error = last_error;
    }
    result.elapsed_ms = elapsed_ms(started);
    return result;
}

PortProbe::PortProbe(std::shared_ptr<TcpConnector> connector, std::chrono::seconds default_timeout)
    : connector_(std::move(connector)), default_timeout_(default_timeout) {}

ProbeResult PortProbe::run(const Monitor& monitor) {
    const auto& config = monitor.config;
    auto result = connector_->connect(config.hostname, config.port, probe_timeout(monitor, default_timeout_));

    if (!result.connected) {
        spdlog::debug("Port check {}:{} failed: {}", config.hostname, config.port, result.error);
        return ProbeResult::failure(
            fmt::format("{}:{} - {}", config.hostname, config.port, result.error));
    }

    return ProbeResult::success(fmt::format("{}:{} - connection established", config.hostname, config.port),
                                result.elapsed_ms);
}
