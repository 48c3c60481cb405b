/**
 * \file message/FrameScanner.hpp
 * \brief Splits a byte stream into CoT frames.
 * \ingroup message_module
 */
#pragma once

#include "config/Config.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace takclient::message {

/**
 * \brief Accumulates stream bytes and yields complete frames.
 * \details XML frames end at `</event>` (leading whitespace between events is dropped);
 * frames starting with 0xbf are delimited by the varint length of the stream header and
 * returned with their header. Datagram channels do not need a scanner.
 */
class FrameScanner {
public:
    explicit FrameScanner(std::size_t max_frame_bytes = config::defaults::MaxFrameBytes);

    void feed(const char* data, std::size_t size);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    /**
     * \brief Next complete frame, or nullopt when more input is needed.
     * \throws FrameTooLong when the buffered data exceeds the window without completing a
     * frame; the buffered data is discarded first so the next call starts clean.
     */
    std::optional<std::string> next_frame();

    std::size_t buffered() const { return buffer_.size(); }
    std::size_t max_frame_bytes() const { return max_frame_bytes_; }
    void reset();

private:
    std::optional<std::string> next_xml_frame();
    std::optional<std::string> next_binary_frame();
    [[noreturn]] void overflow(const std::string& what);

    std::string buffer_;
    std::size_t scan_from_{0};
    std::size_t max_frame_bytes_;
};

} // namespace takclient::message
