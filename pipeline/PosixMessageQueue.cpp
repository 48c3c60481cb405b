/**
 * \file pipeline/PosixMessageQueue.cpp
 * \brief `mq_*` backed frame queue.
 * \ingroup pipeline_module
 */
#include "PosixMessageQueue.hpp"
#include "common/Errors.hpp"
#include "message/EventCodec.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <cerrno>
#include <vector>

namespace takclient::pipeline {

namespace {

constexpr char kEventTag = 'E';
constexpr char kRawTag = 'R';

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

std::string to_message(const message::DecodedFrame& frame) {
    if (const auto* ev = std::get_if<message::CotEvent>(&frame)) {
        return kEventTag + message::EventCodec::encode_xml(*ev);
    }
    return kRawTag + std::get<message::RawFrame>(frame).bytes;
}

message::DecodedFrame from_message(const char* data, std::size_t size) {
    if (size == 0) return message::RawFrame{};
    std::string_view body(data + 1, size - 1);
    if (data[0] == kEventTag) {
        if (auto ev = message::EventCodec::decode_xml(body)) return *ev;
    }
    return message::RawFrame{std::string(body)};
}

} // namespace

PosixMessageQueue::PosixMessageQueue(std::string name, std::size_t capacity, std::size_t max_message_bytes,
                                     bool unlink_on_close, std::shared_ptr<Logger> logger)
    : name_(std::move(name)),
      capacity_(capacity),
      max_message_bytes_(max_message_bytes),
      unlink_on_close_(unlink_on_close),
      logger_(std::move(logger)) {
    mq_attr attr{};
    attr.mq_maxmsg = static_cast<long>(capacity_);
    attr.mq_msgsize = static_cast<long>(max_message_bytes_);
    mq_ = ::mq_open(name_.c_str(), O_RDWR | O_CREAT | O_NONBLOCK, S_IRUSR | S_IWUSR, &attr);
    if (mq_ == static_cast<mqd_t>(-1)) {
        auto ec = last_error();
        if (logger_) logger_->error("mq_open(" + name_ + ") failed: " + ec.message());
        throw ChannelIOError("mq_open(" + name_ + ")", ec);
    }
    // An existing queue keeps its own attributes.
    if (::mq_getattr(mq_, &attr) == 0) {
        capacity_ = static_cast<std::size_t>(attr.mq_maxmsg);
        max_message_bytes_ = static_cast<std::size_t>(attr.mq_msgsize);
    }
    if (logger_) {
        logger_->debug("Opened message queue " + name_ + " (capacity=" + std::to_string(capacity_) +
                       ", msgsize=" + std::to_string(max_message_bytes_) + ")");
    }
}

PosixMessageQueue::~PosixMessageQueue() {
    if (mq_ != static_cast<mqd_t>(-1)) ::mq_close(mq_);
    if (unlink_on_close_) ::mq_unlink(name_.c_str());
}

bool PosixMessageQueue::put(message::DecodedFrame value) {
    const auto msg = to_message(value);
    if (msg.size() > max_message_bytes_) {
        throw ChannelIOError("Frame of " + std::to_string(msg.size()) + " bytes does not fit " + name_,
                             std::make_error_code(std::errc::message_size));
    }
    bool dropped = false;
    std::vector<char> scratch(max_message_bytes_);
    for (;;) {
        if (::mq_send(mq_, msg.data(), msg.size(), 0) == 0) return dropped;
        if (errno == EINTR) continue;
        if (errno != EAGAIN) throw ChannelIOError("mq_send(" + name_ + ")", last_error());
        // Full: discard the oldest message and retry.
        if (::mq_receive(mq_, scratch.data(), scratch.size(), nullptr) < 0 && errno != EAGAIN) {
            throw ChannelIOError("mq_receive(" + name_ + ")", last_error());
        }
        dropped = true;
    }
}

std::optional<message::DecodedFrame> PosixMessageQueue::try_get() {
    std::vector<char> buffer(max_message_bytes_);
    for (;;) {
        auto n = ::mq_receive(mq_, buffer.data(), buffer.size(), nullptr);
        if (n >= 0) return from_message(buffer.data(), static_cast<std::size_t>(n));
        if (errno == EINTR) continue;
        if (errno == EAGAIN) return std::nullopt;
        throw ChannelIOError("mq_receive(" + name_ + ")", last_error());
    }
}

std::size_t PosixMessageQueue::size() const {
    mq_attr attr{};
    if (::mq_getattr(mq_, &attr) != 0) return 0;
    return static_cast<std::size_t>(attr.mq_curmsgs);
}

bool PosixMessageQueue::unlink(const std::string& name) {
    return ::mq_unlink(name.c_str()) == 0;
}

} // namespace takclient::pipeline
