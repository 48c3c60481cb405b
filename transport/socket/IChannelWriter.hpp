/**
 * \file IChannelWriter.hpp
 * \brief Non-blocking write role.
 * \ingroup socket_backend
 */
#pragma once

#include <cstddef>
#include <system_error>
#include "ISocketLifecycle.hpp"

namespace takclient::transport {

/** \brief Write side of a channel pair.
 *  \ingroup socket_backend
 */
struct IChannelWriter : public virtual ISocketLifecycle {
    /**
     * \brief Attempt a non-blocking write.
     * \details Datagram writers send `buffer` as one datagram; stream writers may
     * report a partial count in `bytes_written`.
     * \return true if completed (success or error); false if would block.
     */
    virtual bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) = 0;
};

} // namespace takclient::transport
