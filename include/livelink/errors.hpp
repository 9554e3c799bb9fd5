#pragma once

#include <stdexcept>
#include <string>

namespace livelink {

class LiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing identity code or credentials. Raised before any session exists.
class ConfigError : public LiveError {
public:
    using LiveError::LiveError;
};

// Socket handshake failure while starting a session.
class ConnectError : public LiveError {
public:
    using LiveError::LiveError;
};

// Malformed frame length, bad header or inflate failure.
class ProtocolError : public LiveError {
public:
    using LiveError::LiveError;
};

// Socket or HTTP transport failure.
class TransportError : public LiveError {
public:
    using LiveError::LiveError;
};

// Non-zero response code or unusable response from the open platform REST API.
class ApiError : public LiveError {
public:
    ApiError(int code, const std::string& message)
        : LiveError(message), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

}  // namespace livelink
