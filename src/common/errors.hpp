#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gbmbridge {

    class BridgeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // The native engine returned the failure sentinel.
    class NativeCallError : public BridgeError {
    public:
        NativeCallError(const std::string& component, const std::string& message)
            : BridgeError(component + " call failed in native engine with error: " + message),
              component_(component), message_(message) {}

        const std::string& component() const { return component_; }
        const std::string& native_message() const { return message_; }

    private:
        std::string component_;
        std::string message_;
    };

    class InvalidWorkerIdError : public BridgeError {
    public:
        explicit InvalidWorkerIdError(const std::string& id)
            : BridgeError("Worker id is not an integer: '" + id + "'"), id_(id) {}

        const std::string& id() const { return id_; }

    private:
        std::string id_;
    };

    // default_port + worker id left the TCP port range.
    class PortOutOfRangeError : public BridgeError {
    public:
        PortOutOfRangeError(const std::string& host, int64_t port)
            : BridgeError("Listen port " + std::to_string(port) + " for host '" + host
                + "' is outside [0, 65535]"),
              port_(port) {}

        int64_t port() const { return port_; }

    private:
        int64_t port_;
    };

    class EmptyTopologyError : public BridgeError {
    public:
        EmptyTopologyError()
            : BridgeError("No training workers resolved; cannot build the machine list") {}
    };

    class InconsistentRowLengthError : public BridgeError {
    public:
        InconsistentRowLengthError(int64_t row, int64_t expected, int64_t actual, const std::string& what)
            : BridgeError("Row " + std::to_string(row) + ": " + what + " (expected "
                + std::to_string(expected) + ", got " + std::to_string(actual) + ")"),
              row_(row) {}

        int64_t row() const { return row_; }

    private:
        int64_t row_;
    };

    class EmptyShardError : public BridgeError {
    public:
        EmptyShardError() : BridgeError("Shard has no rows; column count is undefined") {}
    };

} // namespace gbmbridge
