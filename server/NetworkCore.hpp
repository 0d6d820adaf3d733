#pragma once

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <cstdint>
#include <string>
#include <sys/epoll.h>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "../common/ByteBuffer.hpp"
#include "../common/protocol.hpp"

namespace port_watch::server
{
    class Worker;

    struct ClientContext
    {
        int socketfd = -1;
        SSL* ssl_handle = nullptr;
        port_watch::common::ByteBuffer buff;
        bool is_handshake_complete = false;
        uint64_t generation = 0;
    };

    struct OutgoingFrame
    {
        int client_fd;
        uint64_t generation;
        std::vector<uint8_t> frame;
    };

    // TLS control server. Run() drives a single epoll loop on the calling thread;
    // QueueResponse() and Stop() may be called from any thread and wake the loop
    // through an eventfd.
    class NetworkCore
    {
    private:
        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        int m_port;
        std::string m_cert_path;
        std::string m_key_path;
        std::atomic<bool> m_running;
        std::map<int, ClientContext> registry;
        uint64_t m_next_generation;

        SSL_CTX* m_ssl_ctx;
        Worker& m_worker;

        std::mutex m_outbox_mutex;
        std::deque<OutgoingFrame> m_outbox;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);
        void Wake();

        void HandleNewConnection();
        void HandleClientData(int fd);
        void FlushOutbox();

        void ProcessMessage(const ClientContext &ctx, port_watch::protocol::MessageType type, std::vector<uint8_t> payload);

    public:
        NetworkCore(int port, std::string cert_path, std::string key_path, Worker& worker);
        ~NetworkCore();

        NetworkCore(const NetworkCore&) = delete;
        NetworkCore& operator=(const NetworkCore&) = delete;

        void Init();
        void Run();
        void Stop();

        // Port actually bound by Init(); differs from the requested one when that was 0.
        int BoundPort() const;

        // The reply is dropped if the connection identified by (client_fd, generation)
        // has closed in the meantime, even when the fd number was handed to a new client.
        void QueueResponse(int client_fd, uint64_t generation, port_watch::protocol::MessageType type,
                           std::vector<uint8_t> payload);
    };
}
