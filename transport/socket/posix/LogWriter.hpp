/**
 * \file LogWriter.hpp
 * \brief Writer-only channel that copies frames to stdout, stderr or a file.
 * \ingroup socket_backend
 */
#pragma once

#include "transport/socket/IChannelWriter.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

class Logger;

namespace takclient::transport::posix {

/** \brief Loopback sink for `log://` and `file://` destinations; has no read side.
 *  \ingroup socket_backend
 */
class LogWriter : public virtual IChannelWriter {
    struct OwnedFd {
        explicit OwnedFd() = default;
    };

public:
    enum class Target { Stdout, Stderr, File };

    /** \brief Write to stdout or stderr (the descriptor is borrowed, never closed). */
    LogWriter(Target target, std::shared_ptr<Logger> logger = nullptr);
    ~LogWriter() override;

    /** \brief Adopt an already opened descriptor; only reachable through \ref open_file. */
    LogWriter(OwnedFd, int fd, std::string name, std::shared_ptr<Logger> logger);

    LogWriter(const LogWriter&) = delete;
    LogWriter& operator=(const LogWriter&) = delete;

    /** \brief Open `path` for appending, creating missing parent directories. */
    static std::shared_ptr<LogWriter> open_file(const std::string& path, std::shared_ptr<Logger> logger,
                                                std::error_code& error);

    bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) override;

    void close() override;
    bool is_open() const override;
    int get_handle() const override { return fd_; }
    std::string local_endpoint() const override { return name_; }
    std::string remote_endpoint() const override { return name_; }
    std::string socket_type() const override { return "log"; }

private:
    int fd_{-1};
    bool owned_{false};
    std::string name_;
    std::shared_ptr<Logger> logger_;
    mutable std::mutex mtx_;
};

} // namespace takclient::transport::posix
