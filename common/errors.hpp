#pragma once

// ============================================================
// errors.hpp -- Transfer error taxonomy
//
// Every failure that crosses a module boundary is one of these.
// Request handlers map them to HTTP status codes; the download
// client reports them through its error callback.
// ============================================================

#include <stdexcept>
#include <string>

enum class ErrorKind {
    BIND,          // listener could not be bound / no usable interface
    AUTH,          // bad password or token
    RANGE,         // malformed or unsatisfiable Range header
    IO,            // disk failure while serving or building an archive
    NETWORK,       // disconnect, timeout, unexpected status
    SIZE_MISMATCH, // final size differs from the declared size
    CONCURRENCY,   // single-flight violation
};

inline const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::BIND:          return "BindError";
        case ErrorKind::AUTH:          return "AuthError";
        case ErrorKind::RANGE:         return "RangeError";
        case ErrorKind::IO:            return "IOError";
        case ErrorKind::NETWORK:       return "NetworkError";
        case ErrorKind::SIZE_MISMATCH: return "SizeMismatchError";
        case ErrorKind::CONCURRENCY:   return "ConcurrencyError";
    }
    return "TransferError";
}

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

#define LANSHARE_DEFINE_ERROR(Name, Kind)                               \
    class Name : public TransferError {                                 \
    public:                                                             \
        explicit Name(const std::string& msg)                           \
            : TransferError(ErrorKind::Kind, msg) {}                    \
    }

LANSHARE_DEFINE_ERROR(BindError,         BIND);
LANSHARE_DEFINE_ERROR(AuthError,         AUTH);
LANSHARE_DEFINE_ERROR(RangeError,        RANGE);
LANSHARE_DEFINE_ERROR(IOError,           IO);
LANSHARE_DEFINE_ERROR(NetworkError,      NETWORK);
LANSHARE_DEFINE_ERROR(SizeMismatchError, SIZE_MISMATCH);
LANSHARE_DEFINE_ERROR(ConcurrencyError,  CONCURRENCY);

#undef LANSHARE_DEFINE_ERROR
