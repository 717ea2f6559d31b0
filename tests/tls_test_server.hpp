#pragma once

// Loopback servers and throwaway certificates for the prober tests.

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace cwtest
{
struct PkeyFree { void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); } };
struct X509Free { void operator()(X509 *p) const { X509_free(p); } };
struct SslCtxFree { void operator()(SSL_CTX *p) const { SSL_CTX_free(p); } };
struct BioFree { void operator()(BIO *p) const { BIO_free(p); } };

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyFree>;
using X509Ptr = std::unique_ptr<X509, X509Free>;
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxFree>;
using BioPtr = std::unique_ptr<BIO, BioFree>;

// Self-signed P-256 certificate for one subjectAltName entry, e.g.
// "IP:127.0.0.1" or "DNS:localhost".
struct TestCert
{
    PkeyPtr key;
    X509Ptr cert;
};

inline TestCert make_cert(const std::string &san, long valid_seconds, long serial)
{
    TestCert tc;
    tc.key.reset(EVP_EC_gen("P-256"));
    if (!tc.key) throw std::runtime_error("EC keygen failed");

    tc.cert.reset(X509_new());
    X509 *x = tc.cert.get();
    if (!x) throw std::runtime_error("X509_new failed");
    X509_set_version(x, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x), serial);
    X509_gmtime_adj(X509_getm_notBefore(x), -3600);
    X509_gmtime_adj(X509_getm_notAfter(x), valid_seconds);
    X509_set_pubkey(x, tc.key.get());

    const std::string cn = "certwatch test " + san.substr(san.find(':') + 1);
    X509_NAME *name = X509_get_subject_name(x);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char *>(cn.c_str()), -1, -1, 0);
    X509_set_issuer_name(x, name);

    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, x, x, nullptr, nullptr, 0);
    const std::pair<int, std::string> exts[] = {
        {NID_basic_constraints, "critical,CA:TRUE"},
        {NID_subject_alt_name, san},
    };
    for (const auto &[nid, value] : exts)
    {
        X509_EXTENSION *ext = X509V3_EXT_conf_nid(nullptr, &v3, nid, value.c_str());
        if (!ext) throw std::runtime_error("cannot build extension " + value);
        X509_add_ext(x, ext, -1);
        X509_EXTENSION_free(ext);
    }

    if (X509_sign(x, tc.key.get(), EVP_sha256()) == 0)
        throw std::runtime_error("X509_sign failed");
    return tc;
}

// Writes the certificates to a temporary PEM bundle and returns its path.
inline std::string write_bundle(const std::vector<const TestCert *> &certs)
{
    char path[] = "/tmp/certwatch-ca-XXXXXX";
    const int fd = ::mkstemp(path);
    if (fd < 0) throw std::runtime_error("mkstemp failed");
    ::close(fd);

    BioPtr bio(BIO_new_file(path, "w"));
    if (!bio) throw std::runtime_error("cannot open bundle");
    for (const TestCert *c : certs)
    {
        if (PEM_write_bio_X509(bio.get(), c->cert.get()) != 1)
            throw std::runtime_error("PEM write failed");
    }
    return path;
}

inline SslCtxPtr make_server_ctx(const TestCert &tc)
{
    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx ||
        SSL_CTX_use_certificate(ctx.get(), tc.cert.get()) != 1 ||
        SSL_CTX_use_PrivateKey(ctx.get(), tc.key.get()) != 1)
    {
        throw std::runtime_error("server ctx setup failed");
    }
    return ctx;
}

inline int bound_socket(in_addr_t addr, bool do_listen)
{
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw std::runtime_error("socket failed");
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = addr;
    sa.sin_port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr *>(&sa), sizeof(sa)) != 0 ||
        (do_listen && ::listen(fd, 16) != 0))
    {
        ::close(fd);
        throw std::runtime_error("bind/listen failed");
    }
    return fd;
}

inline int port_of(int fd)
{
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    ::getsockname(fd, reinterpret_cast<sockaddr *>(&sa), &len);
    return ntohs(sa.sin_port);
}

// A socket that holds a port without listening: connects are refused.
class ClosedPort
{
public:
    ClosedPort() : fd_(bound_socket(htonl(INADDR_LOOPBACK), false)) {}
    ~ClosedPort() { ::close(fd_); }
    ClosedPort(const ClosedPort &) = delete;
    ClosedPort &operator=(const ClosedPort &) = delete;
    int port() const { return port_of(fd_); }

private:
    int fd_;
};

// Listens but never accepts: TCP connects, the TLS handshake never answers.
class SilentServer
{
public:
    SilentServer() : fd_(bound_socket(htonl(INADDR_LOOPBACK), true)) {}
    ~SilentServer() { ::close(fd_); }
    SilentServer(const SilentServer &) = delete;
    SilentServer &operator=(const SilentServer &) = delete;
    int port() const { return port_of(fd_); }

private:
    int fd_;
};

// Accepts connections on a background thread, one at a time.
// With TLS contexts it serves the certificate registered for the local
// address the client dialed (any 127.x.y.z reaches the wildcard listener),
// switching to the one registered for the SNI name when there is one;
// without them it answers plain text and hangs up.
class LoopbackServer
{
public:
    LoopbackServer() : fd_(bound_socket(htonl(INADDR_ANY), true)) {}

    ~LoopbackServer()
    {
        stop_.store(true);
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    LoopbackServer(const LoopbackServer &) = delete;
    LoopbackServer &operator=(const LoopbackServer &) = delete;

    void serve(const std::string &local_ip, const TestCert &tc)
    {
        SslCtxPtr ctx = make_server_ctx(tc);
        SSL_CTX_set_tlsext_servername_callback(ctx.get(), &LoopbackServer::on_servername);
        SSL_CTX_set_tlsext_servername_arg(ctx.get(), this);
        ctxs_[local_ip] = std::move(ctx);
    }

    // Certificate for clients that send this server name. Register before start().
    void serve_name(const std::string &server_name, const TestCert &tc)
    {
        names_[server_name] = make_server_ctx(tc);
    }

    // SNI of the most recent TLS client; empty when it sent none.
    std::string last_server_name() const
    {
        std::lock_guard<std::mutex> lk(sni_mtx_);
        return last_sni_;
    }

    void start() { thread_ = std::thread([this] { loop(); }); }
    int port() const { return port_of(fd_); }

private:
    void loop()
    {
        while (!stop_.load())
        {
            pollfd p{fd_, POLLIN, 0};
            if (::poll(&p, 1, 50) <= 0) continue;
            const int c = ::accept(fd_, nullptr, nullptr);
            if (c < 0) continue;

            timeval tv{2, 0};
            ::setsockopt(c, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            ::setsockopt(c, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

            if (ctxs_.empty())
            {
                static const char reply[] = "HTTP/1.0 400 Bad Request\r\n\r\n";
                ssize_t n = ::send(c, reply, sizeof(reply) - 1, MSG_NOSIGNAL);
                (void)n;
            }
            else
            {
                handle_tls(c);
            }
            ::close(c);
        }
    }

    static int on_servername(SSL *ssl, int *, void *arg)
    {
        auto *self = static_cast<LoopbackServer *>(arg);
        const char *name = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);
        {
            std::lock_guard<std::mutex> lk(self->sni_mtx_);
            self->last_sni_ = name ? name : "";
        }
        if (name)
        {
            auto it = self->names_.find(name);
            if (it != self->names_.end()) SSL_set_SSL_CTX(ssl, it->second.get());
        }
        return SSL_TLSEXT_ERR_OK;
    }

    void handle_tls(int c)
    {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        ::getsockname(c, reinterpret_cast<sockaddr *>(&local), &len);
        char buf[INET_ADDRSTRLEN]{};
        ::inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf));

        auto it = ctxs_.find(buf);
        if (it == ctxs_.end()) return;

        SSL *ssl = SSL_new(it->second.get());
        if (!ssl) return;
        {
            std::lock_guard<std::mutex> lk(sni_mtx_);
            last_sni_.clear();
        }
        SSL_set_fd(ssl, c);
        if (SSL_accept(ssl) == 1) SSL_shutdown(ssl);
        SSL_free(ssl);
        ERR_clear_error();
    }

    int fd_;
    std::map<std::string, SslCtxPtr> ctxs_;
    std::map<std::string, SslCtxPtr> names_;
    mutable std::mutex sni_mtx_;
    std::string last_sni_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};
} // namespace cwtest
