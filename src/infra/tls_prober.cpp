#include "cw/prober.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// POSIX networking
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/asn1.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>


namespace cw
{
namespace
{
using SteadyClock = std::chrono::steady_clock;

struct SslCtxFree { void operator()(SSL_CTX *p) const { SSL_CTX_free(p); } };
struct SslFree { void operator()(SSL *p) const { SSL_free(p); } };
struct X509Free { void operator()(X509 *p) const { X509_free(p); } };
struct AddrinfoFree { void operator()(addrinfo *p) const { freeaddrinfo(p); } };

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxFree>;
using SslPtr = std::unique_ptr<SSL, SslFree>;
using X509Ptr = std::unique_ptr<X509, X509Free>;
using AddrinfoPtr = std::unique_ptr<addrinfo, AddrinfoFree>;

class Fd
{
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }
    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;
    Fd(Fd &&o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    Fd &operator=(Fd &&o) noexcept
    {
        if (this != &o)
        {
            reset(o.fd_);
            o.fd_ = -1;
        }
        return *this;
    }
    int get() const { return fd_; }
    void reset(int fd = -1)
    {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

// Failure inside one probe; turned into ProbeResult by probe_tls_once.
struct ProbeFailure
{
    ProbeErrorKind kind;
    std::string message;
};

int remaining_ms(SteadyClock::time_point deadline)
{
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// 1 = ready, 0 = deadline reached, -1 = poll error (errno set)
int wait_fd(int fd, short events, SteadyClock::time_point deadline)
{
    for (;;)
    {
        const int ms = remaining_ms(deadline);
        if (ms == 0) return 0;
        pollfd pfd{fd, events, 0};
        const int rc = ::poll(&pfd, 1, ms);
        if (rc < 0 && errno == EINTR) continue;
        if (rc < 0) return -1;
        if (rc == 0) return 0;
        return 1;
    }
}

std::string addr_str(const addrinfo *ai)
{
    char buf[INET6_ADDRSTRLEN]{};
    const void *src = nullptr;
    if (ai->ai_family == AF_INET)
        src = &reinterpret_cast<const sockaddr_in *>(ai->ai_addr)->sin_addr;
    else if (ai->ai_family == AF_INET6)
        src = &reinterpret_cast<const sockaddr_in6 *>(ai->ai_addr)->sin6_addr;
    if (!src || !inet_ntop(ai->ai_family, src, buf, sizeof(buf))) return "?";
    return buf;
}

AddrinfoPtr resolve(const ProbeTarget &target, ProbeFailure &fail)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo *raw = nullptr;
    const std::string service = std::to_string(target.port);
    if (int rc = getaddrinfo(target.host.c_str(), service.c_str(), &hints, &raw);
        rc != 0)
    {
        if (raw) freeaddrinfo(raw);
        fail = {ProbeErrorKind::Connection,
                std::string("cannot resolve ") + target.host + ": " +
                gai_strerror(rc)};
        return nullptr;
    }
    return AddrinfoPtr(raw);
}

// Tries every resolved address in order until one connects.
Fd connect_any(const addrinfo *res, SteadyClock::time_point deadline,
               ProbeFailure &fail)
{
    std::string last = "no usable address";
    for (const addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
        if (remaining_ms(deadline) == 0)
        {
            last = "timed out";
            break;
        }
        Fd fd(::socket(ai->ai_family,
                       ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                       ai->ai_protocol));
        if (!fd)
        {
            last = std::string("socket: ") + std::strerror(errno);
            continue;
        }
        if (::connect(fd.get(), ai->ai_addr, ai->ai_addrlen) == 0) return fd;
        if (errno != EINPROGRESS)
        {
            last = addr_str(ai) + ": " + std::strerror(errno);
            continue;
        }
        const int w = wait_fd(fd.get(), POLLOUT, deadline);
        if (w == 0)
        {
            last = addr_str(ai) + ": timed out";
            break;
        }
        if (w < 0)
        {
            last = addr_str(ai) + ": poll: " + std::strerror(errno);
            continue;
        }
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0)
            err = errno;
        if (err == 0) return fd;
        last = addr_str(ai) + ": " + std::strerror(err);
    }

    fail = {ProbeErrorKind::Connection, last};
    return Fd{};
}

std::string openssl_error_text()
{
    std::string out;
    while (unsigned long e = ERR_get_error())
    {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

bool is_ip_literal(const std::string &host)
{
    unsigned char buf[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

SslCtxPtr make_client_ctx(ProbeFailure &fail)
{
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx)
    {
        fail = {ProbeErrorKind::Handshake, "SSL_CTX_new: " + openssl_error_text()};
        return nullptr;
    }
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1)
    {
        fail = {ProbeErrorKind::Handshake,
                "cannot load default trust store: " + openssl_error_text()};
        return nullptr;
    }
    return ctx;
}

// Drives SSL_connect on a non-blocking socket until done or deadline.
bool handshake(SSL *ssl, int fd, SteadyClock::time_point deadline,
               ProbeFailure &fail)
{
    for (;;)
    {
        ERR_clear_error();
        const int rc = SSL_connect(ssl);
        if (rc == 1) return true;

        const int err = SSL_get_error(ssl, rc);
        short events = 0;
        if (err == SSL_ERROR_WANT_READ) events = POLLIN;
        else if (err == SSL_ERROR_WANT_WRITE) events = POLLOUT;

        if (events != 0)
        {
            const int w = wait_fd(fd, events, deadline);
            if (w == 0)
            {
                fail = {ProbeErrorKind::Handshake, "timed out"};
                return false;
            }
            if (w < 0)
            {
                fail = {ProbeErrorKind::Handshake,
                        std::string("poll: ") + std::strerror(errno)};
                return false;
            }
            continue;
        }

        std::string reason;
        const long verify = SSL_get_verify_result(ssl);
        if (verify != X509_V_OK)
        {
            reason = std::string("certificate verify failed: ") +
                     X509_verify_cert_error_string(verify);
        }
        else if (err == SSL_ERROR_SYSCALL)
        {
            reason = errno != 0 ? std::string(std::strerror(errno))
                                : std::string("unexpected EOF");
            if (std::string ossl = openssl_error_text(); !ossl.empty())
                reason += " (" + ossl + ")";
        }
        else if (err == SSL_ERROR_ZERO_RETURN)
        {
            reason = "connection closed by peer";
        }
        else
        {
            reason = openssl_error_text();
            if (reason.empty()) reason = "SSL error " + std::to_string(err);
        }
        fail = {ProbeErrorKind::Handshake, reason};
        return false;
    }
}

struct Asn1TimeFree { void operator()(ASN1_TIME *p) const { ASN1_TIME_free(p); } };
using Asn1TimePtr = std::unique_ptr<ASN1_TIME, Asn1TimeFree>;

// Offset from the Unix epoch, measured by OpenSSL itself so every year a
// certificate can carry (0000..9999) converts exactly.
std::optional<TimePoint> to_time_point(const ASN1_TIME *t)
{
    Asn1TimePtr epoch(ASN1_TIME_new());
    if (!t || !epoch || !ASN1_TIME_set(epoch.get(), 0)) return std::nullopt;

    int pday = 0;
    int psec = 0;
    if (!ASN1_TIME_diff(&pday, &psec, epoch.get(), t)) return std::nullopt;
    return TimePoint{std::chrono::days{pday} + std::chrono::seconds{psec}};
}

std::optional<TimePoint> read_not_after(SSL *ssl, ProbeFailure &fail)
{
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    X509Ptr cert(SSL_get1_peer_certificate(ssl));
#else
    X509Ptr cert(SSL_get_peer_certificate(ssl));
#endif
    if (!cert)
    {
        fail = {ProbeErrorKind::CertificateParse, "no peer certificate"};
        return std::nullopt;
    }
    const ASN1_TIME *na = X509_get0_notAfter(cert.get());
    auto expiry = to_time_point(na);
    if (!expiry)
    {
        std::string text = na ? std::string(reinterpret_cast<const char *>(ASN1_STRING_get0_data(na)),
                                            static_cast<size_t>(ASN1_STRING_length(na)))
                              : std::string("(missing)");
        fail = {ProbeErrorKind::CertificateParse,
                "unrecognized notAfter '" + text + "'"};
    }
    return expiry;
}

std::string prefixed(ProbeErrorKind kind, const std::string &msg)
{
    switch (kind)
    {
        case ProbeErrorKind::Connection: return "connection error: " + msg;
        case ProbeErrorKind::Handshake: return "handshake error: " + msg;
        case ProbeErrorKind::CertificateParse:
            return "certificate parse error: " + msg;
        case ProbeErrorKind::Internal: return "internal error: " + msg;
        case ProbeErrorKind::None: break;
    }
    return msg;
}
} // namespace

std::optional<TimePoint> parse_asn1_time(std::string_view text)
{
    // ASN1_TIME_set_string wants a NUL-terminated string
    const std::string z(text);
    Asn1TimePtr t(ASN1_TIME_new());
    if (!t || ASN1_TIME_set_string(t.get(), z.c_str()) != 1) return std::nullopt;
    return to_time_point(t.get());
}

ProbeResult probe_tls_once(const ProbeTarget &target,
                           std::chrono::milliseconds timeout)
{
    ProbeResult result{};
    const auto t0 = SteadyClock::now();
    auto finish = [&](const ProbeFailure *fail) -> ProbeResult
    {
        result.ms = std::chrono::duration<double, std::milli>(
            SteadyClock::now() - t0).count();
        if (fail)
        {
            result.kind = fail->kind;
            result.error = prefixed(fail->kind, fail->message);
            result.expiry.reset();
        }
        return result;
    };

    ProbeFailure fail{ProbeErrorKind::None, {}};
    if (target.host.empty() || target.port < 1 || target.port > 65535)
    {
        fail = {ProbeErrorKind::Connection, "invalid target '" + target.host +
                ":" + std::to_string(target.port) + "'"};
        return finish(&fail);
    }

    AddrinfoPtr addrs = resolve(target, fail);
    if (!addrs) return finish(&fail);

    // Resolution is excluded from the budget; the deadline covers the rest.
    const auto deadline = SteadyClock::now() + timeout;
    Fd fd = connect_any(addrs.get(), deadline, fail);
    if (!fd) return finish(&fail);

    SslCtxPtr ctx = make_client_ctx(fail);
    if (!ctx) return finish(&fail);

    SslPtr ssl(SSL_new(ctx.get()));
    if (!ssl || SSL_set_fd(ssl.get(), fd.get()) != 1)
    {
        fail = {ProbeErrorKind::Handshake, "SSL_new: " + openssl_error_text()};
        return finish(&fail);
    }

    // IP literals are verified against IP SANs and never sent as SNI
    if (is_ip_literal(target.host))
    {
        if (X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl.get()),
                                          target.host.c_str()) != 1)
        {
            fail = {ProbeErrorKind::Handshake,
                    "cannot set expected IP: " + openssl_error_text()};
            return finish(&fail);
        }
    }
    else if (SSL_set_tlsext_host_name(ssl.get(), target.host.c_str()) != 1 ||
             SSL_set1_host(ssl.get(), target.host.c_str()) != 1)
    {
        fail = {ProbeErrorKind::Handshake,
                "cannot set server name: " + openssl_error_text()};
        return finish(&fail);
    }

    if (!handshake(ssl.get(), fd.get(), deadline, fail)) return finish(&fail);

    result.expiry = read_not_after(ssl.get(), fail);
    // close_notify is a courtesy to the server; the outcome is already known
    ERR_clear_error();
    if (SSL_shutdown(ssl.get()) < 0) ERR_clear_error();

    if (!result.expiry) return finish(&fail);
    return finish(nullptr);
}
} // namespace cw
