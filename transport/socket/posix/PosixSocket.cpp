/**
 * \file PosixSocket.cpp
 * \brief Implementation of the BSD-socket stream.
 * \ingroup socket_backend
 */
#include "PosixSocket.hpp"
#include "PosixErrors.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace transport {

namespace {

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0; // SO_NOSIGPIPE is set in setup_socket instead
#endif

// Connect poll slice; bounds how long shutdown() takes to abandon a connect.
constexpr int kConnectPollSliceMs = 100;

std::string format_endpoint(const sockaddr_storage& ss) {
    char ip[INET6_ADDRSTRLEN] = {0};
    unsigned short port = 0;
    if (ss.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&ss);
        ::inet_ntop(AF_INET, &in->sin_addr, ip, sizeof(ip));
        port = ntohs(in->sin_port);
        return std::string(ip) + ":" + std::to_string(port);
    }
    if (ss.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip));
        port = ntohs(in6->sin6_port);
        return "[" + std::string(ip) + "]:" + std::to_string(port);
    }
    return "";
}

void set_blocking(int fd, bool blocking) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    ::fcntl(fd, F_SETFL, flags);
}

} // namespace

// === PosixSocket Implementation ===

PosixSocket::PosixSocket() = default;

PosixSocket::PosixSocket(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

PosixSocket::~PosixSocket() {
    // Direct cleanup; no virtual dispatch from the destructor
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        fd = socket_fd_;
        socket_fd_ = -1;
    }
    if (fd >= 0) {
        ::close(fd);
    }
}

std::shared_ptr<PosixSocket> PosixSocket::create(std::shared_ptr<Logger> logger) {
    return std::make_shared<PosixSocket>(std::move(logger));
}

void PosixSocket::setup_socket(int fd) {
    int flags = ::fcntl(fd, F_GETFD, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
#ifdef SO_NOSIGPIPE
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
    if (recv_timeout_.count() > 0) {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(recv_timeout_.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((recv_timeout_.count() % 1000) * 1000);
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
}

int PosixSocket::current_fd() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    return socket_fd_;
}

void PosixSocket::connect(const std::string& host, int port, std::error_code& error,
                          std::chrono::milliseconds timeout) {
    error.clear();
    if (port <= 0 || port > 65535) {
        error = std::make_error_code(std::errc::invalid_argument);
        return;
    }
    if (current_fd() >= 0) {
        error = std::make_error_code(std::errc::already_connected);
        return;
    }
    if (shutdown_requested_.load(std::memory_order_relaxed)) {
        error = std::make_error_code(std::errc::operation_canceled);
        return;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (gai != 0) {
        error = posix::make_resolver_error(gai);
        if (logger_) logger_->debug("PosixSocket::connect: resolve " + host + " failed: " + error.message());
        return;
    }

    error = std::make_error_code(std::errc::host_unreachable);
    for (addrinfo* rp = results; rp != nullptr; rp = rp->ai_next) {
        if (connect_one(rp->ai_addr, static_cast<unsigned>(rp->ai_addrlen), rp->ai_family, timeout, error)) {
            break;
        }
        if (error == std::errc::operation_canceled) {
            break;
        }
    }
    ::freeaddrinfo(results);

    if (!error && logger_) {
        logger_->debug("PosixSocket connected " + local_endpoint() + " -> " + remote_endpoint());
    }
}

bool PosixSocket::connect_one(const void* addr, unsigned addr_len, int family, std::chrono::milliseconds timeout,
                              std::error_code& error) {
    int fd = ::socket(family, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        error = posix::translate_errno(errno);
        return false;
    }
    setup_socket(fd);

    // Publish the fd before connecting so shutdown()/close() can interrupt us
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        socket_fd_ = fd;
    }

    auto abandon = [this, fd](std::error_code ec, std::error_code& out) {
        bool still_owned = false;
        {
            std::lock_guard<std::mutex> lock(socket_mtx_);
            if (socket_fd_ == fd) {
                socket_fd_ = -1;
                still_owned = true;
            }
        }
        // close() may already have released the fd
        if (still_owned) {
            ::close(fd);
        }
        out = ec;
        return false;
    };

    set_blocking(fd, false);
    int rc = ::connect(fd, static_cast<const sockaddr*>(addr), static_cast<socklen_t>(addr_len));
    if (rc != 0 && errno != EINPROGRESS && errno != EINTR) {
        return abandon(posix::translate_errno(errno), error);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (rc != 0) {
        if (shutdown_requested_.load(std::memory_order_relaxed) || current_fd() != fd) {
            return abandon(std::make_error_code(std::errc::operation_canceled), error);
        }

        int slice = kConnectPollSliceMs;
        if (timeout.count() > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return abandon(std::make_error_code(std::errc::timed_out), error);
            }
            if (remaining.count() < slice) slice = static_cast<int>(remaining.count());
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int pr = ::poll(&pfd, 1, slice);
        if (pr < 0) {
            if (errno == EINTR) continue;
            return abandon(posix::translate_errno(errno), error);
        }
        if (pr == 0) {
            continue; // slice elapsed; re-check shutdown and deadline
        }

        int sock_err = 0;
        socklen_t len = sizeof(sock_err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &len) != 0) {
            return abandon(posix::translate_errno(errno), error);
        }
        if (sock_err != 0) {
            return abandon(posix::translate_errno(sock_err), error);
        }
        rc = 0;
    }

    set_blocking(fd, true);
    error.clear();
    set_no_delay(true);
    return true;
}

void PosixSocket::read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) {
    bytes_read = 0;
    const int fd = current_fd();
    if (fd < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }

    for (;;) {
        ssize_t result = ::recv(fd, buffer, size, 0);
        if (result > 0) {
            bytes_read = static_cast<size_t>(result);
            error.clear();
            return;
        }
        if (result == 0) {
            // Our own shutdown() also produces end-of-stream; report it as cancellation
            if (shutdown_requested_.load(std::memory_order_relaxed)) {
                error = std::make_error_code(std::errc::operation_canceled);
            } else {
                error.clear();
            }
            return;
        }
        int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (posix::is_would_block_errno(err)) {
            // SO_RCVTIMEO expired
            error = std::make_error_code(std::errc::timed_out);
            return;
        }
        error = posix::translate_errno(err);
        return;
    }
}

void PosixSocket::write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) {
    bytes_written = 0;
    const int fd = current_fd();
    if (fd < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }

    for (;;) {
        ssize_t result = ::send(fd, buffer, size, kSendFlags);
        if (result >= 0) {
            bytes_written = static_cast<size_t>(result);
            error.clear();
            return;
        }
        int err = errno;
        if (err == EINTR) {
            continue;
        }
        error = posix::translate_errno(err);
        return;
    }
}

bool PosixSocket::set_receive_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() < 0) {
        timeout = std::chrono::milliseconds{0};
    }
    recv_timeout_ = timeout;
    const int fd = current_fd();
    if (fd < 0) {
        return true; // applied by setup_socket() on connect
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        if (logger_) logger_->warning("Failed to set SO_RCVTIMEO on fd " + std::to_string(fd));
        return false;
    }
    return true;
}

bool PosixSocket::peer_closed() const {
    const int fd = current_fd();
    if (fd < 0) {
        return true;
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
#ifdef POLLRDHUP
    pfd.events |= POLLRDHUP;
#endif
    if (::poll(&pfd, 1, 0) <= 0) {
        return false;
    }
    if (pfd.revents & (POLLERR | POLLNVAL | POLLHUP)) {
        return true;
    }
#ifdef POLLRDHUP
    // FIN seen even if unread reply bytes are still queued ahead of it
    if (pfd.revents & POLLRDHUP) {
        return true;
    }
#endif
    char peeked = 0;
    ssize_t result = ::recv(fd, &peeked, 1, MSG_PEEK | MSG_DONTWAIT);
    if (result == 0) {
        return true;
    }
    if (result < 0) {
        int err = errno;
        return !(posix::is_would_block_errno(err) || err == EINTR);
    }
    return false; // unread data pending and no FIN reported
}

void PosixSocket::close() {
    int fd_to_close = -1;
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        if (socket_fd_ >= 0) {
            fd_to_close = socket_fd_;
            socket_fd_ = -1;
        }
    }
    if (fd_to_close >= 0) {
        ::close(fd_to_close);
        if (logger_) logger_->debug("PosixSocket closed fd " + std::to_string(fd_to_close));
    }
}

void PosixSocket::shutdown() {
    shutdown_requested_.store(true, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ >= 0) {
        // ENOTCONN for a half-open connect is expected and harmless
        ::shutdown(socket_fd_, SHUT_RDWR);
    }
}

bool PosixSocket::is_open() const {
    return current_fd() >= 0;
}

int PosixSocket::get_handle() const {
    return current_fd();
}

std::string PosixSocket::local_endpoint() const {
    const int fd = current_fd();
    if (fd < 0) return "";
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return "";
    return format_endpoint(ss);
}

std::string PosixSocket::remote_endpoint() const {
    const int fd = current_fd();
    if (fd < 0) return "";
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return "";
    return format_endpoint(ss);
}

std::string PosixSocket::socket_type() const {
    return "posix_tcp";
}

bool PosixSocket::set_no_delay(bool enable) {
    const int fd = current_fd();
    if (fd < 0) {
        return false;
    }
    int flag = enable ? 1 : 0;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0) {
        return true;
    }
    if (logger_) {
        logger_->warning("Failed to set TCP_NODELAY on fd " + std::to_string(fd));
    }
    return false;
}

} // namespace transport
