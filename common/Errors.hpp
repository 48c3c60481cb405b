/**
 * \file common/Errors.hpp
 * \brief Error taxonomy shared by the transport, TLS, package and pipeline layers.
 * \details Low-level socket calls report through `std::error_code` out-parameters;
 * builders and workers translate failures into one of these exception types so a
 * caller can always tell which stage failed.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace takclient {

/** \brief Category tag carried by every \ref Error. */
enum class ErrorKind {
    UnsupportedScheme,
    AddressError,
    BindError,
    CertificateError,
    HandshakeError,
    PackageError,
    DependencyMissing,
    FrameTooLong,
    ChannelIOError,
    ConfigError
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedScheme: return "UnsupportedScheme";
        case ErrorKind::AddressError:      return "AddressError";
        case ErrorKind::BindError:         return "BindError";
        case ErrorKind::CertificateError:  return "CertificateError";
        case ErrorKind::HandshakeError:    return "HandshakeError";
        case ErrorKind::PackageError:      return "PackageError";
        case ErrorKind::DependencyMissing: return "DependencyMissing";
        case ErrorKind::FrameTooLong:      return "FrameTooLong";
        case ErrorKind::ChannelIOError:    return "ChannelIOError";
        case ErrorKind::ConfigError:       return "ConfigError";
    }
    return "Unknown";
}

/** \brief Root of the taxonomy. */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }
private:
    ErrorKind kind_;
};

/** \brief Base for failures while building a channel (4.1). */
class TransportError : public Error {
public:
    using Error::Error;
};

class UnsupportedScheme : public TransportError {
public:
    explicit UnsupportedScheme(const std::string& message)
        : TransportError(ErrorKind::UnsupportedScheme, message) {}
};

class AddressError : public TransportError {
public:
    explicit AddressError(const std::string& message)
        : TransportError(ErrorKind::AddressError, message) {}
};

class BindError : public TransportError {
public:
    explicit BindError(const std::string& message)
        : TransportError(ErrorKind::BindError, message) {}
};

/** \brief Base for TLS setup failures (4.2). */
class TlsError : public Error {
public:
    using Error::Error;
};

class CertificateError : public TlsError {
public:
    explicit CertificateError(const std::string& message)
        : TlsError(ErrorKind::CertificateError, message) {}
};

class HandshakeError : public TlsError {
public:
    explicit HandshakeError(const std::string& message)
        : TlsError(ErrorKind::HandshakeError, message) {}
};

class PackageError : public Error {
public:
    explicit PackageError(const std::string& message)
        : Error(ErrorKind::PackageError, message) {}
};

class DependencyMissing : public Error {
public:
    explicit DependencyMissing(const std::string& message)
        : Error(ErrorKind::DependencyMissing, message) {}
};

/** \brief A setting is malformed or out of range; the message names the key. */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::ConfigError, message) {}
};

/** \brief Non-fatal: a stream frame exceeded the scan window and was discarded. */
class FrameTooLong : public Error {
public:
    explicit FrameTooLong(const std::string& message)
        : Error(ErrorKind::FrameTooLong, message) {}
};

/** \brief Fatal read/write failure on a pipeline channel. */
class ChannelIOError : public Error {
public:
    ChannelIOError(const std::string& what, std::error_code ec)
        : Error(ErrorKind::ChannelIOError, what + ": " + ec.message()), code_(ec) {}
    const std::error_code& code() const noexcept { return code_; }
private:
    std::error_code code_;
};

} // namespace takclient
