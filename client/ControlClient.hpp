#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include "../common/protocol.hpp"
#include "../common/ByteBuffer.hpp"

namespace port_watch::client
{
    struct Response
    {
        port_watch::protocol::MessageType type;
        std::vector<uint8_t> data;
    };

    // Blocking TLS client for the control protocol: one request, one reply.
    class ControlClient
    {
    private:
        std::string m_host;
        int m_port;
        int m_socket_fd;
        int m_timeout_ms;

        std::mutex m_io_mutex;

        SSL_CTX *m_ssl_ctx;
        SSL *m_ssl_handle;

        port_watch::common::ByteBuffer m_rx_buf;

        void InitSSL(const std::string &ca_path);
        void CleanupSSL();
        void CloseLocked();

        bool SendFrameLocked(port_watch::protocol::MessageType type, const std::vector<uint8_t> &payload);
        bool ReadNextFrameLocked(port_watch::common::Frame &out);

    public:
        // With an empty ca_path the server certificate is not verified.
        ControlClient(std::string host, int port, const std::string &ca_path = "", int timeout_ms = 5000);
        ~ControlClient();

        ControlClient(const ControlClient &) = delete;
        ControlClient &operator=(const ControlClient &) = delete;

        bool Connect();
        void Disconnect();
        bool IsConnected() const { return m_socket_fd != -1 && m_ssl_handle != nullptr; }

        std::optional<Response> Request(port_watch::protocol::MessageType type, const std::vector<uint8_t> &payload);
    };
}
