/**
 * \file ChannelPair.hpp
 * \brief Ownership-scoped (reader, writer) pair produced by the transport builders.
 * \ingroup socket_backend
 */
#pragma once

#include <memory>
#include <string>
#include "IChannelReader.hpp"
#include "IChannelWriter.hpp"

namespace takclient::transport {

/**
 * \brief Reader and writer ends of one resolved destination.
 * \details Either end may be null (write-only and log channels have no reader),
 * never both. Bidirectional transports hand out the same object for both ends.
 */
struct ChannelPair {
    std::shared_ptr<IChannelReader> reader;
    std::shared_ptr<IChannelWriter> writer;
    /** \brief Canonical destination string, for diagnostics. */
    std::string description;

    bool has_reader() const { return static_cast<bool>(reader); }
    bool has_writer() const { return static_cast<bool>(writer); }

    /** \brief Close both ends (once, if shared). */
    void close() {
        if (writer) writer->close();
        if (reader && static_cast<ISocketLifecycle*>(reader.get()) != static_cast<ISocketLifecycle*>(writer.get())) {
            reader->close();
        }
    }
};

} // namespace takclient::transport
