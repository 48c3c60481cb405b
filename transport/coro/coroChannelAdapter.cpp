/**
 * \file coroChannelAdapter.cpp
 * \brief Implementation details for `transport::CoroChannelAdapter`.
 */
#include "CoroChannelAdapter.hpp"

namespace takclient::transport {

bool CoroChannelAdapter::try_complete_read() {
    if (!channel_.reader) {
        read_op_.error = std::make_error_code(std::errc::operation_not_supported);
        return true;
    }
    return channel_.reader->try_read(read_op_.buffer, read_op_.size, read_op_.transferred, read_op_.error);
}

bool CoroChannelAdapter::try_complete_write() {
    if (!channel_.writer) {
        write_op_.error = std::make_error_code(std::errc::operation_not_supported);
        return true;
    }
    return channel_.writer->try_write(write_op_.buffer, write_op_.size, write_op_.transferred, write_op_.error);
}

} // namespace takclient::transport
