/**
 * \file message/FrameScanner.cpp
 * \brief `</event>` and varint-length stream framing.
 * \ingroup message_module
 */
#include "FrameScanner.hpp"
#include "TakProtocol.hpp"
#include "common/Errors.hpp"

#include <cctype>
#include <string_view>

namespace takclient::message {

namespace {
constexpr std::string_view kEventEnd = "</event>";
}

FrameScanner::FrameScanner(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

void FrameScanner::feed(const char* data, std::size_t size) {
    buffer_.append(data, size);
}

void FrameScanner::reset() {
    buffer_.clear();
    scan_from_ = 0;
}

void FrameScanner::overflow(const std::string& what) {
    auto discarded = buffer_.size();
    reset();
    throw FrameTooLong(what + " (" + std::to_string(discarded) + " bytes discarded, limit " +
                       std::to_string(max_frame_bytes_) + ")");
}

std::optional<std::string> FrameScanner::next_frame() {
    size_t skip = 0;
    while (skip < buffer_.size() && std::isspace(static_cast<unsigned char>(buffer_[skip]))) ++skip;
    if (skip) {
        buffer_.erase(0, skip);
        scan_from_ = scan_from_ > skip ? scan_from_ - skip : 0;
    }
    if (buffer_.empty()) return std::nullopt;

    if (TakProtocol::starts_with_magic(buffer_)) return next_binary_frame();
    return next_xml_frame();
}

std::optional<std::string> FrameScanner::next_xml_frame() {
    auto pos = std::string_view(buffer_).find(kEventEnd, scan_from_);
    if (pos == std::string_view::npos) {
        if (buffer_.size() > max_frame_bytes_) overflow("No </event> within the frame window");
        // Resume scanning where a split delimiter could still start.
        scan_from_ = buffer_.size() >= kEventEnd.size() ? buffer_.size() - kEventEnd.size() + 1 : 0;
        return std::nullopt;
    }
    auto end = pos + kEventEnd.size();
    if (end > max_frame_bytes_) overflow("CoT frame exceeds the frame window");
    std::string frame = buffer_.substr(0, end);
    buffer_.erase(0, end);
    scan_from_ = 0;
    return frame;
}

std::optional<std::string> FrameScanner::next_binary_frame() {
    size_t header_len = 0;
    size_t payload_len = 0;
    auto status = TakProtocol::unframe(buffer_, TakProtoVariant::Stream, header_len, payload_len);
    if (status == TakProtocol::Status::Invalid) overflow("Malformed TAK protocol 1 length");
    if (header_len && payload_len > max_frame_bytes_) overflow("TAK protocol 1 frame exceeds the frame window");
    if (status == TakProtocol::Status::Incomplete) {
        if (buffer_.size() > max_frame_bytes_) overflow("Incomplete TAK protocol 1 frame");
        return std::nullopt;
    }
    auto total = header_len + payload_len;
    std::string frame = buffer_.substr(0, total);
    buffer_.erase(0, total);
    scan_from_ = 0;
    return frame;
}

} // namespace takclient::message
