#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <iostream>

#include "NetworkCore.hpp"
#include "Worker.hpp"
#include <netinet/in.h>

namespace port_watch::server
{

    namespace
    {
        bool WaitFd(int fd, short events, int timeout_ms = 5000)
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

        // The socket is non-blocking, so a slow reader can stall one write for at
        // most the poll timeout before the client is dropped.
        bool SslWriteAll(SSL *ssl, int fd, const uint8_t *data, size_t len)
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
                    if (!WaitFd(fd, POLLIN))
                        return false;
                    continue;
                }
                if (err == SSL_ERROR_WANT_WRITE)
                {
                    if (!WaitFd(fd, POLLOUT))
                        return false;
                    continue;
                }

                return false;
            }
            return true;
        }
    }

    void NetworkCore::LogOpenSSLErrors()
    {
        unsigned long code = 0;
        char buf[256];
        while ((code = ERR_get_error()) != 0)
        {
            ERR_error_string_n(code, buf, sizeof(buf));
            std::cerr << "[Server] OpenSSL: " << buf << std::endl;
        }
    }

    void NetworkCore::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            throw std::runtime_error(std::string("Failed to set O_NONBLOCK: ") + std::strerror(errno));
        }
    }

    void NetworkCore::EpollControlAdd(int fd)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = EPOLLIN;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void NetworkCore::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[Server] Warning: Failed to remove FD " << fd << " from epoll" << std::endl;
        }
    }

    void NetworkCore::DisconnectClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        EpollControlRemove(fd);
        if (it->second.ssl_handle)
        {
            if (it->second.is_handshake_complete)
                SSL_shutdown(it->second.ssl_handle);
            SSL_free(it->second.ssl_handle);
        }
        close(fd);
        registry.erase(it);

        std::cout << "[Server] Client " << fd << " disconnected." << std::endl;
    }

    void NetworkCore::Wake()
    {
        uint64_t one = 1;
        if (m_wake_fd != -1 && write(m_wake_fd, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one)))
        {
            std::cerr << "[Server] Wake-up write failed: " << std::strerror(errno) << std::endl;
        }
    }

    void NetworkCore::HandleNewConnection()
    {
        while (true)
        {
            int client_fd = accept4(m_server_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (client_fd == -1)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    return;
                if (errno == EINTR || errno == ECONNABORTED)
                    continue;
                std::cerr << "[Server] accept failed: " << std::strerror(errno) << std::endl;
                return;
            }

            SSL *ssl_handle = SSL_new(m_ssl_ctx);
            if (!ssl_handle)
            {
                LogOpenSSLErrors();
                close(client_fd);
                continue;
            }

            SSL_set_fd(ssl_handle, client_fd);
            SSL_set_mode(ssl_handle, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

            ClientContext &ctx = registry[client_fd];
            ctx.socketfd = client_fd;
            ctx.ssl_handle = ssl_handle;
            ctx.is_handshake_complete = false;
            ctx.generation = m_next_generation++;

            try
            {
                EpollControlAdd(client_fd);
            }
            catch (const std::runtime_error &e)
            {
                std::cerr << "[Server] " << e.what() << " (client " << client_fd << ")" << std::endl;
                SSL_free(ssl_handle);
                close(client_fd);
                registry.erase(client_fd);
                continue;
            }

            std::cout << "[Server] New connection accepted: " << client_fd << std::endl;

            // The handshake is driven from HandleClientData as records arrive.
            HandleClientData(client_fd);
        }
    }

    void NetworkCore::HandleClientData(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        ClientContext &ctx = it->second;

        if (ctx.is_handshake_complete == false)
        {
            int ret = SSL_accept(ctx.ssl_handle);

            if (ret == 1)
            {
                ctx.is_handshake_complete = true;
                std::cout << "[Server] TLS Handshake complete for client " << fd << std::endl;
            }
            else
            {
                int err = SSL_get_error(ctx.ssl_handle, ret);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                {
                    return;
                }
                std::cerr << "[Server] SSL Handshake Failed for client " << fd << ". Error: " << err << std::endl;
                LogOpenSSLErrors();
                DisconnectClient(fd);
                return;
            }
        }

        uint8_t temp_buffer[4096];

        while (true)
        {
            int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));

            if (count > 0)
            {
                ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, count);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                break;

            DisconnectClient(fd);
            return;
        }

        port_watch::common::Frame frame;
        while (true)
        {
            auto status = ctx.buff.NextFrame(frame);
            if (status == port_watch::common::FrameStatus::Incomplete)
                break;
            if (status == port_watch::common::FrameStatus::Invalid)
            {
                auto header = ctx.buff.PeekHeader();
                std::cerr << "[Server] Invalid frame header from client " << fd << " (magic 0x" << std::hex
                          << header.magic << std::dec << ", length " << header.payload_length
                          << "). Disconnecting." << std::endl;
                DisconnectClient(fd);
                return;
            }

            ProcessMessage(ctx, frame.type, std::move(frame.payload));
        }
    }

    void NetworkCore::ProcessMessage(const ClientContext &ctx, port_watch::protocol::MessageType type,
                                     std::vector<uint8_t> payload)
    {
        std::cout << "[Client " << ctx.socketfd << "] Received " << port_watch::protocol::MessageTypeName(type)
                  << " | Size: " << payload.size() << " bytes." << std::endl;

        m_worker.AddJob(ctx.socketfd, ctx.generation, type, std::move(payload));
    }

    void NetworkCore::QueueResponse(int client_fd, uint64_t generation, port_watch::protocol::MessageType type,
                                    std::vector<uint8_t> payload)
    {
        {
            std::lock_guard<std::mutex> lock(m_outbox_mutex);
            m_outbox.push_back({client_fd, generation, port_watch::protocol::BuildFrame(type, payload)});
        }
        Wake();
    }

    void NetworkCore::FlushOutbox()
    {
        std::deque<OutgoingFrame> pending;
        {
            std::lock_guard<std::mutex> lock(m_outbox_mutex);
            pending.swap(m_outbox);
        }

        for (auto &out : pending)
        {
            auto it = registry.find(out.client_fd);
            if (it == registry.end() || it->second.generation != out.generation || !it->second.is_handshake_complete)
            {
                std::cerr << "[Server] Dropping reply for closed client " << out.client_fd << std::endl;
                continue;
            }

            if (!SslWriteAll(it->second.ssl_handle, out.client_fd, out.frame.data(), out.frame.size()))
            {
                std::cerr << "[Server] Write to client " << out.client_fd << " failed. Disconnecting." << std::endl;
                LogOpenSSLErrors();
                DisconnectClient(out.client_fd);
            }
        }
    }

    NetworkCore::NetworkCore(int port, std::string cert_path, std::string key_path, Worker &worker)
        : m_server_fd(-1), m_epoll_fd(-1), m_wake_fd(-1), m_port(port),
          m_cert_path(std::move(cert_path)), m_key_path(std::move(key_path)),
          m_running(false), m_next_generation(1), m_ssl_ctx(nullptr), m_worker(worker)
    {
    }

    NetworkCore::~NetworkCore()
    {
        for (auto &it : registry)
        {
            if (it.second.ssl_handle)
                SSL_free(it.second.ssl_handle);
            close(it.first);
        }
        registry.clear();

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void NetworkCore::Init()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_server_method());
        if (m_ssl_ctx == nullptr)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to create SSL Context.");
        }

        if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load certificate '" + m_cert_path + "'.");
        }

        if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load private key '" + m_key_path + "'.");
        }

        if (!SSL_CTX_check_private_key(m_ssl_ctx))
        {
            throw std::runtime_error("Private Key does not match the Certificate!");
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(static_cast<uint16_t>(m_port));
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, (struct sockaddr *)&serverAddress, sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind port " + std::to_string(m_port) + ". Is the port taken?");
        }

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen server socket.");
        }

        m_epoll_fd = epoll_create1(EPOLL_CLOEXEC);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        m_wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create wake-up eventfd.");
        }

        EpollControlAdd(m_server_fd);
        EpollControlAdd(m_wake_fd);

        // Set here rather than in Run() so a Stop() issued in between is not lost.
        m_running = true;
    }

    int NetworkCore::BoundPort() const
    {
        if (m_server_fd == -1)
            return m_port;

        struct sockaddr_in addr;
        socklen_t len = sizeof(addr);
        if (getsockname(m_server_fd, (struct sockaddr *)&addr, &len) != 0)
            return m_port;
        return ntohs(addr.sin_port);
    }

    void NetworkCore::Stop()
    {
        m_running = false;
        Wake();
    }

    void NetworkCore::Run()
    {
        if (m_epoll_fd == -1)
            throw std::logic_error("NetworkCore::Run called before Init");

        std::cout << "[Server] Listening on port " << BoundPort() << "..." << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (m_running)
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, -1)) == -1)
            {
                if (errno == EINTR)
                    continue;
                std::cerr << "[Server] epoll_wait failed: " << std::strerror(errno) << std::endl;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                if (current_fd == m_server_fd)
                {
                    HandleNewConnection();
                }
                else if (current_fd == m_wake_fd)
                {
                    uint64_t value = 0;
                    while (read(m_wake_fd, &value, sizeof(value)) > 0)
                    {
                    }
                    FlushOutbox();
                }
                else
                {
                    HandleClientData(current_fd);
                }
            }
        }

        std::cout << "[Server] Stopped." << std::endl;
    }
}
