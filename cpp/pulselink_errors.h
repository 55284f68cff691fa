#pragma once

#include <stdexcept>
#include <string>
#include "pulselink_core.h"

namespace pulselink {

enum class BluetoothState {
    Unknown,
    Resetting,
    Unsupported,
    Unauthorized,
    PoweredOff,
    PoweredOn
};

const char* bluetoothStateName(BluetoothState s);

enum class ErrorCategory {
    Transport, // radio state, connection, link loss
    Protocol,  // discovery, notification setup, operation timeouts
    Data       // malformed or insufficient samples
};

enum class ErrorKind {
	// Transport
	BluetoothNotReady,
	BluetoothUnauthorized,
	BluetoothUnsupported,
	BluetoothResetting,
	ConnectionFailed,
	ConnectionTimeout,
	UnexpectedDisconnection,
	PeripheralNotFound,
	PeripheralNotConnected,
	InvalidPeripheral,
	MaxReconnectAttemptsExceeded,
	// Protocol
	ServiceDiscoveryFailed,
	CharacteristicDiscoveryFailed,
	NotificationSetupFailed,
	ConfigurationFailed,
	Timeout,
	Cancelled,
	// Data
	DataCorrupted,
	InsufficientData
};

enum class ErrorSeverity {
    Info = 0,
    Warning,
    Error,
    Critical
};

ErrorCategory errorCategory(ErrorKind kind);

struct TransportError {
    ErrorKind kind {ErrorKind::ConnectionFailed};
    PeripheralId peripheral;
    std::string detail;              // reason / operation name
    double seconds {0.0};            // timeouts
    int attempts {0};                // reconnection exhaustion
    BluetoothState state {BluetoothState::Unknown};

    TransportError() = default;
    TransportError(ErrorKind k, PeripheralId id, std::string d = {})
        : kind(k), peripheral(std::move(id)), detail(std::move(d)) {}

    static TransportError timeout(const std::string& operation, double secs, PeripheralId id = {});
    static TransportError reconnectExhausted(PeripheralId id, int attempts);
    static TransportError bluetoothNotReady(BluetoothState s);

    ErrorCategory category() const { return errorCategory(kind); }
    std::string describe() const;
    ErrorSeverity severity() const;
    bool isRecoverable() const;
    bool shouldTriggerReconnection() const;
    // Stable code: PULSELINK_E1xx transport, E2xx protocol, E3xx data
    const char* code() const;
};

// Thrown by the device facade for caller mistakes (unknown peripheral, ...)
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(TransportError e)
        : std::runtime_error(e.describe()), error_(std::move(e)) {}
    const TransportError& error() const { return error_; }
private:
    TransportError error_;
};

// Completion value of one asynchronous hardware step
struct OperationResult {
    bool ok {true};
    TransportError error;

    static OperationResult success() { return OperationResult{}; }
    static OperationResult failure(TransportError e) {
        OperationResult r;
        r.ok = false;
        r.error = std::move(e);
        return r;
    }
    static OperationResult timedOut(const std::string& operation, double secs, PeripheralId id = {}) {
        return failure(TransportError::timeout(operation, secs, std::move(id)));
    }
};

} // namespace pulselink
