#include "Worker.hpp"
#include "NetworkCore.hpp"
#include "RequestHandler.hpp"
#include "../common/Messages.hpp"

#include <iostream>

namespace port_watch::server
{

    Worker::Worker(RequestHandler &handler) : running_(false), handler_(handler), network_core_(nullptr) {}

    Worker::~Worker()
    {
        Stop();
    }

    void Worker::Start()
    {
        if (running_)
            return;
        running_ = true;
        worker_thread_ = std::thread(&Worker::ProcessLoop, this);
    }

    void Worker::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_)
                return;
            running_ = false;
        }
        queue_cv_.notify_all();

        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
    }

    void Worker::AddJob(int client_fd, uint64_t generation, port_watch::protocol::MessageType type,
                        std::vector<uint8_t> payload)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            job_queue_.push({client_fd, generation, type, std::move(payload)});
        }
        queue_cv_.notify_one();
    }

    void Worker::SendFailure(const Job &job, const std::string &what)
    {
        if (!network_core_)
            return;

        try
        {
            port_watch::protocol::ErrorReply err;
            err.code = port_watch::protocol::ErrorCode::Persistence;
            err.message = "Internal server error: " + what;
            network_core_->QueueResponse(job.client_fd, job.generation, port_watch::protocol::MessageType::ErrorResp,
                                         port_watch::protocol::EncodeError(err));
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Worker] Could not send error reply to fd " << job.client_fd << ": " << e.what() << "\n";
        }
    }

    void Worker::ProcessLoop()
    {
        while (true)
        {
            Job current_job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                queue_cv_.wait(lock, [this]
                               { return !job_queue_.empty() || !running_; });

                if (!running_ && job_queue_.empty())
                    break;

                current_job = std::move(job_queue_.front());
                job_queue_.pop();
            }

            try
            {
                Reply reply = handler_.Handle(current_job.type, current_job.payload);

                if (network_core_)
                {
                    network_core_->QueueResponse(current_job.client_fd, current_job.generation, reply.type,
                                                 std::move(reply.payload));
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Worker] Error processing "
                          << port_watch::protocol::MessageTypeName(current_job.type) << " from fd "
                          << current_job.client_fd << ": " << e.what() << "\n";
                SendFailure(current_job, e.what());
            }
        }
    }
}
