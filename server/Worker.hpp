#pragma once

#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <vector>
#include <atomic>
#include <cstdint>
#include <string>
#include "../common/protocol.hpp"

namespace port_watch::server { class NetworkCore; class RequestHandler; }

namespace port_watch::server {

    struct Job {
        int client_fd;
        uint64_t generation; // connection the request arrived on; fds are reused
        port_watch::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    // Runs control requests off the network thread and hands the replies back
    // to NetworkCore for writing.
    class Worker {
    private:
        std::thread worker_thread_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::queue<Job> job_queue_;
        std::atomic<bool> running_;

        RequestHandler& handler_;
        NetworkCore* network_core_;

        void ProcessLoop();
        void SendFailure(const Job &job, const std::string &what);

    public:
        explicit Worker(RequestHandler& handler);
        ~Worker();

        void Start();
        void Stop();

        void SetNetworkCore(NetworkCore* core) { network_core_ = core; }

        void AddJob(int client_fd, uint64_t generation, port_watch::protocol::MessageType type,
                    std::vector<uint8_t> payload);
    };
}
