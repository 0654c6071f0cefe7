#include "subscout/probe/tls_check.hpp"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>

namespace subscout {
namespace probe {

namespace {

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const { if (ctx) SSL_CTX_free(ctx); }
};

struct SslDeleter {
    void operator()(SSL* ssl) const { if (ssl) SSL_free(ssl); }
};

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { if (info) freeaddrinfo(info); }
};

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) ::close(fd_); }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

std::string lastSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "handshake failed";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

bool connectWithTimeout(int fd, const sockaddr* addr, socklen_t len, int timeout_ms, std::string& detail) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, addr, len);
    if (rc != 0 && errno != EINPROGRESS) {
        detail = std::strerror(errno);
        return false;
    }

    if (rc != 0) {
        pollfd pfd{fd, POLLOUT, 0};
        rc = poll(&pfd, 1, timeout_ms);
        if (rc == 0) {
            detail = "connect timed out";
            return false;
        }
        if (rc < 0) {
            detail = std::strerror(errno);
            return false;
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
        if (so_error != 0) {
            detail = std::strerror(so_error);
            return false;
        }
    }

    fcntl(fd, F_SETFL, flags);

    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return true;
}

}

TlsCheckResult checkTls(const std::string& host, uint16_t port, double timeout_seconds) {
    TlsCheckResult result;
    int timeout_ms = static_cast<int>(timeout_seconds * 1000.0);
    if (timeout_ms <= 0) {
        timeout_ms = 1;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    AddrInfoPtr addresses(raw);
    if (gai != 0) {
        result.error = core::CoreErrorCode::HTTP_CONNECTION_FAILED;
        result.detail = gai_strerror(gai);
        return result;
    }

    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        result.error = core::CoreErrorCode::TLS_HANDSHAKE_FAILED;
        result.detail = lastSslError();
        return result;
    }
    SSL_CTX_set_default_verify_paths(ctx.get());
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);

    result.error = core::CoreErrorCode::HTTP_CONNECTION_FAILED;
    result.detail = "no address";

    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        SocketGuard sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.get() < 0) {
            result.detail = std::strerror(errno);
            continue;
        }

        std::string detail;
        if (!connectWithTimeout(sock.get(), ai->ai_addr, ai->ai_addrlen, timeout_ms, detail)) {
            result.error = detail == "connect timed out"
                ? core::CoreErrorCode::HTTP_TIMEOUT
                : core::CoreErrorCode::HTTP_CONNECTION_FAILED;
            result.detail = detail;
            continue;
        }

        SslPtr ssl(SSL_new(ctx.get()));
        if (!ssl) {
            result.error = core::CoreErrorCode::TLS_HANDSHAKE_FAILED;
            result.detail = lastSslError();
            return result;
        }

        SSL_set_tlsext_host_name(ssl.get(), host.c_str());
        SSL_set1_host(ssl.get(), host.c_str());
        SSL_set_fd(ssl.get(), sock.get());

        ERR_clear_error();
        if (SSL_connect(ssl.get()) == 1) {
            SSL_shutdown(ssl.get());
            result.ok = true;
            result.error.reset();
            result.detail.clear();
            return result;
        }

        result.error = core::CoreErrorCode::TLS_HANDSHAKE_FAILED;
        result.detail = lastSslError();
        return result;
    }

    return result;
}

}}
