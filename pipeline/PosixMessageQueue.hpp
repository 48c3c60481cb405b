/**
 * \file pipeline/PosixMessageQueue.hpp
 * \brief Cross-process frame queue backed by a POSIX message queue.
 * \ingroup pipeline_module
 */
#pragma once

#include "IQueue.hpp"
#include "message/CotEvent.hpp"
#include "logger.hpp"

#include <mqueue.h>

#include <memory>
#include <string>

namespace takclient::pipeline {

/**
 * \brief \ref IQueue of decoded frames stored in an `mq_*` queue.
 * \details Each message is a one-byte tag followed by the body: `E` for an event
 * (stored as XML) or `R` for a raw frame. The descriptor is non-blocking; waiting
 * is done by polling through \ref IQueue::get.
 *
 * Linux caps `capacity` at `/proc/sys/fs/mqueue/msg_max` (10 by default for
 * unprivileged users) and `max_message_bytes` at `msgsize_max` (8192).
 */
class PosixMessageQueue : public IQueue<message::DecodedFrame> {
public:
    /**
     * \param name Queue name, starting with '/'.
     * \param unlink_on_close Remove the name when this object is destroyed.
     * \throws ChannelIOError if the queue cannot be opened.
     */
    PosixMessageQueue(std::string name, std::size_t capacity, std::size_t max_message_bytes = 8192,
                      bool unlink_on_close = true, std::shared_ptr<Logger> logger = nullptr);
    ~PosixMessageQueue() override;

    PosixMessageQueue(const PosixMessageQueue&) = delete;
    PosixMessageQueue& operator=(const PosixMessageQueue&) = delete;

    /** \throws ChannelIOError if the encoded frame exceeds the message size or the send fails. */
    bool put(message::DecodedFrame value) override;
    /** \throws ChannelIOError on a receive failure other than "empty". */
    std::optional<message::DecodedFrame> try_get() override;
    std::size_t size() const override;
    std::size_t capacity() const override { return capacity_; }

    const std::string& name() const { return name_; }
    std::size_t max_message_bytes() const { return max_message_bytes_; }

    /** \brief Remove a queue name; false if it did not exist. */
    static bool unlink(const std::string& name);

private:
    std::string name_;
    std::size_t capacity_;
    std::size_t max_message_bytes_;
    bool unlink_on_close_;
    std::shared_ptr<Logger> logger_;
    mqd_t mq_{static_cast<mqd_t>(-1)};
};

} // namespace takclient::pipeline
