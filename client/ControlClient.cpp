#include "ControlClient.hpp"
#include <iostream>
#include <stdexcept>
#include <unistd.h>
#include <netdb.h>
#include <cerrno>
#include <cstring>
#include <vector>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace port_watch::client
{

    static bool wait_fd(int fd, short events, int timeout_ms)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int r = 0;
        do
        {
            r = poll(&pfd, 1, timeout_ms);
        } while (r < 0 && errno == EINTR);
        return r > 0;
    }

    static bool ssl_write_all(SSL *ssl, int fd, const uint8_t *data, size_t len, int timeout_ms)
    {
        size_t off = 0;
        while (off < len)
        {
            int n = SSL_write(ssl, data + off, static_cast<int>(len - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }

            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(fd, POLLIN, timeout_ms))
                    return false;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(fd, POLLOUT, timeout_ms))
                    return false;
                continue;
            }

            return false;
        }
        return true;
    }

    ControlClient::ControlClient(std::string host, int port, const std::string &ca_path, int timeout_ms)
        : m_host(std::move(host)), m_port(port), m_socket_fd(-1), m_timeout_ms(timeout_ms),
          m_ssl_ctx(nullptr), m_ssl_handle(nullptr)
    {
        InitSSL(ca_path);
    }

    ControlClient::~ControlClient()
    {
        Disconnect();
        CleanupSSL();
    }

    void ControlClient::InitSSL(const std::string &ca_path)
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            ERR_print_errors_fp(stderr);
            throw std::runtime_error("Failed to create client SSL context.");
        }

        if (ca_path.empty())
        {
            SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_NONE, nullptr);
            return;
        }

        if (SSL_CTX_load_verify_locations(m_ssl_ctx, ca_path.c_str(), nullptr) != 1)
        {
            ERR_print_errors_fp(stderr);
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
            throw std::runtime_error("Failed to load CA file '" + ca_path + "'.");
        }
        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_PEER, nullptr);
    }

    void ControlClient::CleanupSSL()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    bool ControlClient::Connect()
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);
        CloseLocked();

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_NUMERICSERV;

        addrinfo *res = nullptr;
        int gai = getaddrinfo(m_host.c_str(), std::to_string(m_port).c_str(), &hints, &res);
        if (gai != 0)
        {
            std::cerr << "[Client] Cannot resolve " << m_host << ": " << gai_strerror(gai) << std::endl;
            return false;
        }

        for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
        {
            int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0)
                continue;
            if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
            {
                m_socket_fd = fd;
                break;
            }
            close(fd);
        }
        freeaddrinfo(res);

        if (m_socket_fd == -1)
        {
            std::cerr << "[Client] Connection to " << m_host << ":" << m_port << " failed: " << std::strerror(errno)
                      << std::endl;
            return false;
        }

        // Blocking socket; the timeouts bound the handshake and every read.
        timeval tv{};
        tv.tv_sec = m_timeout_ms / 1000;
        tv.tv_usec = (m_timeout_ms % 1000) * 1000;
        setsockopt(m_socket_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(m_socket_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        m_ssl_handle = SSL_new(m_ssl_ctx);
        if (!m_ssl_handle)
        {
            ERR_print_errors_fp(stderr);
            CloseLocked();
            return false;
        }
        SSL_set_fd(m_ssl_handle, m_socket_fd);
        SSL_set_tlsext_host_name(m_ssl_handle, m_host.c_str());

        if (SSL_connect(m_ssl_handle) <= 0)
        {
            ERR_print_errors_fp(stderr);
            CloseLocked();
            return false;
        }

        return true;
    }

    void ControlClient::CloseLocked()
    {
        if (m_ssl_handle)
        {
            SSL_shutdown(m_ssl_handle);
            SSL_free(m_ssl_handle);
            m_ssl_handle = nullptr;
        }
        if (m_socket_fd != -1)
        {
            close(m_socket_fd);
            m_socket_fd = -1;
        }
        m_rx_buf.Clear();
    }

    void ControlClient::Disconnect()
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);
        CloseLocked();
    }

    bool ControlClient::SendFrameLocked(port_watch::protocol::MessageType type, const std::vector<uint8_t> &payload)
    {
        std::vector<uint8_t> frame = port_watch::protocol::BuildFrame(type, payload);
        return ssl_write_all(m_ssl_handle, m_socket_fd, frame.data(), frame.size(), m_timeout_ms);
    }

    bool ControlClient::ReadNextFrameLocked(port_watch::common::Frame &out)
    {
        uint8_t tmp[4096];

        while (true)
        {
            port_watch::common::Frame frame;
            auto status = m_rx_buf.NextFrame(frame);
            if (status == port_watch::common::FrameStatus::Ready)
            {
                out = std::move(frame);
                return true;
            }
            if (status == port_watch::common::FrameStatus::Invalid)
            {
                std::cerr << "[Client] Malformed reply header from server.\n";
                CloseLocked();
                return false;
            }

            if (SSL_pending(m_ssl_handle) == 0 && !wait_fd(m_socket_fd, POLLIN, m_timeout_ms))
            {
                std::cerr << "[Client] Timed out waiting for reply.\n";
                CloseLocked();
                return false;
            }

            int n = SSL_read(m_ssl_handle, tmp, sizeof(tmp));
            if (n > 0)
            {
                m_rx_buf.Append(tmp, static_cast<size_t>(n));
                continue;
            }

            int err = SSL_get_error(m_ssl_handle, n);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                continue;

            if (err == SSL_ERROR_ZERO_RETURN)
                std::cerr << "[Client] Server closed connection.\n";
            else
                std::cerr << "[Client] SSL_read fatal error: " << err << "\n";
            CloseLocked();
            return false;
        }
    }

    std::optional<Response> ControlClient::Request(port_watch::protocol::MessageType type,
                                                   const std::vector<uint8_t> &payload)
    {
        std::lock_guard<std::mutex> lock(m_io_mutex);

        if (!m_ssl_handle)
            return std::nullopt;

        if (!SendFrameLocked(type, payload))
        {
            std::cerr << "[Client] Failed to send " << port_watch::protocol::MessageTypeName(type) << "\n";
            CloseLocked();
            return std::nullopt;
        }

        port_watch::common::Frame frame;
        if (!ReadNextFrameLocked(frame))
            return std::nullopt;

        return Response{frame.type, std::move(frame.payload)};
    }
}
