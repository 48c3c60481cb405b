/**
 * \file IChannelReader.hpp
 * \brief Non-blocking read role.
 * \ingroup socket_backend
 */
#pragma once

#include <cstddef>
#include <system_error>
#include "ISocketLifecycle.hpp"

namespace takclient::transport {

/** \brief Read side of a channel pair.
 *  \ingroup socket_backend
 */
struct IChannelReader : public virtual ISocketLifecycle {
    /**
     * \brief Attempt a non-blocking read.
     * \param buffer Destination buffer.
     * \param size Maximum bytes to read.
     * \param bytes_read Out: bytes read.
     * \param error Receives error on completion; cleared on success or would-block.
     * \return true if completed (success or error); false if would block.
     */
    virtual bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) = 0;
    /** \brief True if each completed read returns exactly one datagram. */
    virtual bool message_oriented() const { return false; }
};

} // namespace takclient::transport
