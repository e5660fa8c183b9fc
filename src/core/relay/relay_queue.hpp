// src/core/relay/relay_queue.hpp
#ifndef UDP_RELAY_RELAY_QUEUE_HPP
#define UDP_RELAY_RELAY_QUEUE_HPP

#include "relay_types.hpp"
#include "config_manager.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>

namespace UdpRelay
{
    namespace Relay
    {
        /**
         * @class RelayQueue
         * @brief Bounded inbound mailbox of one endpoint
         *
         * push() never blocks. When the queue is full the overflow policy
         * decides which message is lost and the drop counter advances. The
         * overflow warning is logged outside the lock, at most once a second.
         *
         * A non-blocking pipe mirrors the queue state: its read end is
         * readable exactly while messages are pending, so the owning relay
         * loop can poll it next to the capture descriptor.
         */
        class RelayQueue
        {
        public:
            /**
             * @throws std::system_error if the wake pipe cannot be created
             */
            explicit RelayQueue(const std::string &owner,
                                size_t capacity = kSendQueueCapacity,
                                Common::OverflowPolicy policy = Common::OverflowPolicy::DROP_OLDEST);
            ~RelayQueue();

            RelayQueue(const RelayQueue &) = delete;
            RelayQueue &operator=(const RelayQueue &) = delete;

            /**
             * @brief Enqueue a message
             * @return false if a message (the new or the oldest one) was dropped
             */
            bool push(RelayMessagePtr message);

            /**
             * @brief Dequeue the oldest message
             * @return false if the queue is empty
             */
            bool tryPop(RelayMessagePtr &message);

            size_t size() const;
            size_t capacity() const { return capacity_; }
            bool empty() const { return size() == 0; }
            uint64_t droppedCount() const { return dropped_.load(); }
            Common::OverflowPolicy policy() const { return policy_; }
            const std::string &owner() const { return owner_; }

            /**
             * @brief Descriptor that polls readable while the queue is non-empty
             */
            int waitFd() const { return wake_[0]; }

        private:
            void signalLocked();
            void clearSignalLocked();

            std::string owner_;
            size_t capacity_;
            Common::OverflowPolicy policy_;

            std::deque<RelayMessagePtr> queue_;
            mutable std::mutex mutex_;
            std::atomic<uint64_t> dropped_;
            std::chrono::steady_clock::time_point last_drop_warning_;
            uint64_t suppressed_drops_;
            int wake_[2];
        };

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_RELAY_QUEUE_HPP
