/**
 * \file LogWriter.cpp
 * \brief Implementation of the log/file writer channel.
 * \ingroup socket_backend
 */
#include "LogWriter.hpp"
#include "SocketAddress.hpp"
#include "logger.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace takclient::transport::posix {

LogWriter::LogWriter(Target target, std::shared_ptr<Logger> logger)
    : fd_(target == Target::Stderr ? STDERR_FILENO : STDOUT_FILENO),
      owned_(false),
      name_(target == Target::Stderr ? "stderr" : "stdout"),
      logger_(std::move(logger)) {}

LogWriter::LogWriter(OwnedFd, int fd, std::string name, std::shared_ptr<Logger> logger)
    : fd_(fd), owned_(true), name_(std::move(name)), logger_(std::move(logger)) {}

LogWriter::~LogWriter() {
    if (owned_ && fd_ >= 0) ::close(fd_);
}

std::shared_ptr<LogWriter> LogWriter::open_file(const std::string& path, std::shared_ptr<Logger> logger,
                                                std::error_code& error) {
    error.clear();
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), error);
        if (error) return nullptr;
    }
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = last_error();
        return nullptr;
    }
    return std::make_shared<LogWriter>(OwnedFd{}, fd, path, std::move(logger));
}

bool LogWriter::try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) {
    bytes_written = 0;
    std::lock_guard<std::mutex> lock(mtx_);
    if (fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    ssize_t result = ::write(fd_, buffer, size);
    if (result >= 0) {
        bytes_written = static_cast<size_t>(result);
        error.clear();
        return true;
    }
    int err = errno;
    if (is_would_block(err)) return false;
    error = std::error_code(err, std::generic_category());
    return true;
}

void LogWriter::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (fd_ < 0) return;
    if (owned_) ::close(fd_);
    fd_ = -1;
    if (logger_) logger_->debug("LogWriter closed " + name_);
}

bool LogWriter::is_open() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return fd_ >= 0;
}

} // namespace takclient::transport::posix
