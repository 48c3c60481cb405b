/**
 * \file IAsyncStream.hpp
 * \brief Combined non-blocking read + write interface.
 * \ingroup socket_backend
 * \see IChannelReader \see IChannelWriter
 */
#pragma once

#include "IChannelReader.hpp"
#include "IChannelWriter.hpp"

namespace takclient::transport {

/** \brief Bidirectional channel; one object serves both ends of a \ref ChannelPair.
 *  \ingroup socket_backend
 */
struct IAsyncStream : public virtual IChannelReader, public virtual IChannelWriter {};

} // namespace takclient::transport
