/**
 * \file socket_groups.hpp
 * \brief Doxygen group definitions for the socket layer.
 * \details Centralizes group declarations so interfaces and backends can tag
 *  themselves with \ingroup socket_backend.
 */

/** \defgroup socket_backend Socket Backend
 *  \brief Role-based channel interfaces and concrete backends.
 *  \details This group contains the transport/socket interfaces (reader, writer,
 *  client, lifecycle), the destination resolver, and the POSIX backends (TCP,
 *  UDP unicast/broadcast/multicast, log writer).
 */
