/**
 * \file IClientSocket.hpp
 * \brief Client connection interface.
 * \ingroup socket_backend
 * \details Blocking connect; the socket switches to non-blocking mode once
 * connected so the coroutine layer can poll it.
 */
#pragma once

#include <string>
#include <system_error>
#include "ISocketLifecycle.hpp"

namespace takclient::transport {

/** \brief Client socket role interface.
 *  \ingroup socket_backend
 */
struct IClientSocket : public virtual ISocketLifecycle {
    /** \brief Establish a blocking connection; sets `error` on failure (non-throwing). */
    virtual void connect(const std::string& host, int port, std::error_code& error) = 0;
};

} // namespace takclient::transport
