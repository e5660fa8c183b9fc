// src/core/relay/relay_queue.cpp
#include "relay_queue.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace UdpRelay
{
    namespace Relay
    {
        namespace
        {
            // At most one overflow warning per queue in this interval
            constexpr std::chrono::seconds kDropWarningInterval(1);
        }

        RelayQueue::RelayQueue(const std::string &owner, size_t capacity, Common::OverflowPolicy policy)
            : owner_(owner),
              capacity_(capacity > 0 ? capacity : 1),
              policy_(policy),
              dropped_(0),
              suppressed_drops_(0),
              wake_{-1, -1}
        {
            if (::pipe(wake_) < 0)
            {
                throw std::system_error(errno, std::generic_category(), owner_ + ": wake pipe");
            }

            for (int fd : wake_)
            {
                int flags = ::fcntl(fd, F_GETFL, 0);
                if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
                {
                    int saved = errno;
                    ::close(wake_[0]);
                    ::close(wake_[1]);
                    throw std::system_error(saved, std::generic_category(), owner_ + ": wake pipe O_NONBLOCK");
                }
            }
        }

        RelayQueue::~RelayQueue()
        {
            ::close(wake_[0]);
            ::close(wake_[1]);
        }

        bool RelayQueue::push(RelayMessagePtr message)
        {
            bool warn = false;
            uint64_t suppressed = 0;
            std::string dropped_source;

            {
                std::lock_guard<std::mutex> lock(mutex_);

                if (queue_.size() < capacity_)
                {
                    queue_.push_back(std::move(message));
                    if (queue_.size() == 1)
                    {
                        signalLocked();
                    }
                    return true;
                }

                dropped_.fetch_add(1);

                if (policy_ == Common::OverflowPolicy::DROP_NEWEST)
                {
                    dropped_source = message->source_interface;
                }
                else
                {
                    dropped_source = queue_.front()->source_interface;
                    queue_.pop_front();
                    queue_.push_back(std::move(message));
                }

                auto now = std::chrono::steady_clock::now();
                if (last_drop_warning_ == std::chrono::steady_clock::time_point() ||
                    now - last_drop_warning_ >= kDropWarningInterval)
                {
                    warn = true;
                    suppressed = suppressed_drops_;
                    suppressed_drops_ = 0;
                    last_drop_warning_ = now;
                }
                else
                {
                    suppressed_drops_++;
                }
            }

            if (warn)
            {
                spdlog::warn("{}: send queue full ({} messages), dropping {} packet from {}"
                             " ({} more dropped since the last warning, {} total)",
                             owner_, capacity_,
                             policy_ == Common::OverflowPolicy::DROP_NEWEST ? "newest" : "oldest",
                             dropped_source, suppressed, dropped_.load());
            }
            return false;
        }

        bool RelayQueue::tryPop(RelayMessagePtr &message)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (queue_.empty())
            {
                return false;
            }

            message = std::move(queue_.front());
            queue_.pop_front();

            if (queue_.empty())
            {
                clearSignalLocked();
            }
            return true;
        }

        size_t RelayQueue::size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return queue_.size();
        }

        void RelayQueue::signalLocked()
        {
            char b = 1;
            if (::write(wake_[1], &b, 1) < 0 && errno != EAGAIN)
            {
                spdlog::error("{}: wake pipe write failed: {}", owner_, std::strerror(errno));
            }
        }

        void RelayQueue::clearSignalLocked()
        {
            char buf[64];
            while (::read(wake_[0], buf, sizeof(buf)) > 0)
            {
            }
        }

    } // namespace Relay
} // namespace UdpRelay
