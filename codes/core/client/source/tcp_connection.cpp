// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: tcp_connection.cpp
//  描述: TcpConnection非阻塞TCP客户端socket实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "client/tcp_connection.hpp"
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace clobber {
namespace client {

TcpConnection::TcpConnection()
    : fd_(-1)
    , last_error_(0)
{
}

TcpConnection::~TcpConnection() {
    close();
}

TcpConnection::TcpConnection(TcpConnection&& other) noexcept
    : fd_(other.fd_)
    , last_error_(other.last_error_)
{
    other.fd_ = -1;
}

TcpConnection& TcpConnection::operator=(TcpConnection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        last_error_ = other.last_error_;
        other.fd_ = -1;
    }
    return *this;
}

ConnectStatus TcpConnection::start_connect(const config::TargetAddress& target) {
    close();
    last_error_ = 0;

    fd_ = ::socket(target.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        last_error_ = errno;
        return ConnectStatus::FAILED;
    }

    // 请求负载通常很小，关闭Nagle避免额外延迟
    int one = 1;
    (void)::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    int ret;
    do {
        ret = ::connect(fd_, target.sockaddr_ptr(), target.sockaddr_len());
    } while (ret != 0 && errno == EINTR);

    if (ret == 0) {
        return ConnectStatus::CONNECTED;
    }
    if (errno == EINPROGRESS) {
        return ConnectStatus::IN_PROGRESS;
    }

    last_error_ = errno;
    close();
    return ConnectStatus::FAILED;
}

int TcpConnection::finish_connect() {
    if (fd_ < 0) {
        last_error_ = EBADF;
        return last_error_;
    }
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
        err = errno;
    }
    last_error_ = err;
    return err;
}

IoStatus TcpConnection::write_some(const uint8_t* data, size_t len, size_t& written) {
    written = 0;
    while (written < len) {
        ssize_t n = ::send(fd_, data + written, len - written, MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return IoStatus::WOULD_BLOCK;
        }
        last_error_ = n < 0 ? errno : EPIPE;
        return IoStatus::ERROR;
    }
    return IoStatus::OK;
}

IoStatus TcpConnection::read_some(char* buf, size_t len, size_t& n) {
    n = 0;
    while (true) {
        ssize_t ret = ::recv(fd_, buf, len, 0);
        if (ret > 0) {
            n = static_cast<size_t>(ret);
            return IoStatus::OK;
        }
        if (ret == 0) {
            return IoStatus::CLOSED;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::WOULD_BLOCK;
        }
        last_error_ = errno;
        return IoStatus::ERROR;
    }
}

void TcpConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::string TcpConnection::last_error_string() const {
    return std::strerror(last_error_);
}

bool is_resource_exhaustion(int err) {
    return err == EMFILE || err == ENFILE || err == EADDRNOTAVAIL ||
           err == ENOBUFS || err == ENOMEM;
}

} // namespace client
} // namespace clobber

// 文件结束
