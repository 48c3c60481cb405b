/**
 * \file ISocketLifecycle.hpp
 * \brief Common lifecycle and endpoint query interface for all channel roles.
 * \ingroup socket_backend
 * \details Provides handle, endpoint, and basic readiness queries shared by
 * reader and writer channel roles. Higher layers (coroutine adapters, the
 * session) depend on this for generic closure and endpoint reporting.
 */
#pragma once

#include <string>

namespace takclient::transport {

/** \brief Base interface for common socket lifecycle and endpoint methods.
 *  \ingroup socket_backend
 */
struct ISocketLifecycle {
    virtual ~ISocketLifecycle() = default;

    /** \brief Close the underlying transport; subsequent operations fail with bad_file_descriptor. */
    virtual void close() = 0;
    /** \brief True if underlying transport is currently open. */
    virtual bool is_open() const = 0;
    /** \brief Native handle (or -1 if not applicable). */
    virtual int get_handle() const = 0;
    /** \brief Local endpoint string representation. */
    virtual std::string local_endpoint() const = 0;
    /** \brief Remote endpoint string representation. */
    virtual std::string remote_endpoint() const = 0;
    /** \brief Transport type identifier (e.g. tcp, udp, tls, log). */
    virtual std::string socket_type() const = 0;
};

} // namespace takclient::transport
