#include "pulselink_errors.h"

#include <cstdio>

namespace pulselink {

namespace {
std::string orUnknown(const std::string& s) {
    return s.empty() ? std::string("Unknown reason") : s;
}
std::string wholeSeconds(double s) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%d", static_cast<int>(s));
    return buf;
}
} // namespace

const char* bluetoothStateName(BluetoothState s) {
    switch (s) {
        case BluetoothState::Unknown: return "Unknown";
        case BluetoothState::Resetting: return "Resetting";
        case BluetoothState::Unsupported: return "Unsupported";
        case BluetoothState::Unauthorized: return "Unauthorized";
        case BluetoothState::PoweredOff: return "Powered Off";
        case BluetoothState::PoweredOn: return "Powered On";
    }
    return "Unknown";
}

ErrorCategory errorCategory(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ServiceDiscoveryFailed:
        case ErrorKind::CharacteristicDiscoveryFailed:
        case ErrorKind::NotificationSetupFailed:
        case ErrorKind::ConfigurationFailed:
        case ErrorKind::Timeout:
        case ErrorKind::Cancelled:
            return ErrorCategory::Protocol;
        case ErrorKind::DataCorrupted:
        case ErrorKind::InsufficientData:
            return ErrorCategory::Data;
        default:
            return ErrorCategory::Transport;
    }
}

TransportError TransportError::timeout(const std::string& operation, double secs, PeripheralId id) {
    TransportError e(ErrorKind::Timeout, std::move(id), operation);
    e.seconds = secs;
    return e;
}

TransportError TransportError::reconnectExhausted(PeripheralId id, int attempts) {
    TransportError e(ErrorKind::MaxReconnectAttemptsExceeded, std::move(id));
    e.attempts = attempts;
    return e;
}

TransportError TransportError::bluetoothNotReady(BluetoothState s) {
    ErrorKind k = ErrorKind::BluetoothNotReady;
    if (s == BluetoothState::Unauthorized) k = ErrorKind::BluetoothUnauthorized;
    else if (s == BluetoothState::Unsupported) k = ErrorKind::BluetoothUnsupported;
    else if (s == BluetoothState::Resetting) k = ErrorKind::BluetoothResetting;
    TransportError e(k, PeripheralId{});
    e.state = s;
    return e;
}

std::string TransportError::describe() const {
    switch (kind) {
        case ErrorKind::BluetoothNotReady:
            return std::string("Bluetooth is not ready (state: ") + bluetoothStateName(state) + ")";
        case ErrorKind::BluetoothUnauthorized:
            return "Bluetooth access is not authorized";
        case ErrorKind::BluetoothUnsupported:
            return "Bluetooth Low Energy is not supported on this device";
        case ErrorKind::BluetoothResetting:
            return "Bluetooth is resetting";
        case ErrorKind::ConnectionFailed:
            return "Connection failed: " + orUnknown(detail);
        case ErrorKind::ConnectionTimeout:
            return "Connection timed out after " + wholeSeconds(seconds) + " seconds";
        case ErrorKind::UnexpectedDisconnection:
            return "Device disconnected unexpectedly: " + orUnknown(detail);
        case ErrorKind::PeripheralNotFound:
            return "Device not found: " + peripheral.value;
        case ErrorKind::PeripheralNotConnected:
            return "Device is not connected: " + peripheral.value;
        case ErrorKind::InvalidPeripheral:
            return "Invalid peripheral: " + (peripheral.empty() ? std::string("<none>") : peripheral.value);
        case ErrorKind::MaxReconnectAttemptsExceeded:
            return "Connection lost: reconnection failed after " + std::to_string(attempts) + " attempts";
        case ErrorKind::ServiceDiscoveryFailed:
            return "Service discovery failed: " + orUnknown(detail);
        case ErrorKind::CharacteristicDiscoveryFailed:
            return "Characteristic discovery failed: " + orUnknown(detail);
        case ErrorKind::NotificationSetupFailed:
            return "Notification setup failed: " + orUnknown(detail);
        case ErrorKind::ConfigurationFailed:
            return "Device configuration failed: " + orUnknown(detail);
        case ErrorKind::Timeout:
            return detail + " timed out after " + wholeSeconds(seconds) + " seconds";
        case ErrorKind::Cancelled:
            return detail + " was cancelled";
        case ErrorKind::DataCorrupted:
            return "Data corrupted: " + orUnknown(detail);
        case ErrorKind::InsufficientData:
            return "Insufficient data: " + orUnknown(detail);
    }
    return "Unknown error";
}

ErrorSeverity TransportError::severity() const {
    switch (kind) {
        case ErrorKind::Cancelled:
            return ErrorSeverity::Info;
        case ErrorKind::BluetoothResetting:
        case ErrorKind::Timeout:
        case ErrorKind::ConnectionTimeout:
            return ErrorSeverity::Warning;
        case ErrorKind::BluetoothNotReady:
        case ErrorKind::ConnectionFailed:
        case ErrorKind::UnexpectedDisconnection:
        case ErrorKind::DataCorrupted:
        case ErrorKind::MaxReconnectAttemptsExceeded:
            return ErrorSeverity::Error;
        case ErrorKind::BluetoothUnauthorized:
        case ErrorKind::BluetoothUnsupported:
            return ErrorSeverity::Critical;
        default:
            return ErrorSeverity::Warning;
    }
}

bool TransportError::isRecoverable() const {
    switch (kind) {
        case ErrorKind::BluetoothUnauthorized:
        case ErrorKind::BluetoothUnsupported:
        case ErrorKind::MaxReconnectAttemptsExceeded:
        case ErrorKind::Cancelled:
        case ErrorKind::InvalidPeripheral:
            return false;
        default:
            return true;
    }
}

bool TransportError::shouldTriggerReconnection() const {
    return kind == ErrorKind::UnexpectedDisconnection || kind == ErrorKind::ConnectionTimeout;
}

const char* TransportError::code() const {
    switch (kind) {
        case ErrorKind::BluetoothNotReady: return "PULSELINK_E101";
        case ErrorKind::BluetoothUnauthorized: return "PULSELINK_E102";
        case ErrorKind::BluetoothUnsupported: return "PULSELINK_E103";
        case ErrorKind::BluetoothResetting: return "PULSELINK_E104";
        case ErrorKind::ConnectionFailed: return "PULSELINK_E110";
        case ErrorKind::ConnectionTimeout: return "PULSELINK_E111";
        case ErrorKind::UnexpectedDisconnection: return "PULSELINK_E112";
        case ErrorKind::PeripheralNotFound: return "PULSELINK_E113";
        case ErrorKind::PeripheralNotConnected: return "PULSELINK_E114";
        case ErrorKind::InvalidPeripheral: return "PULSELINK_E115";
        case ErrorKind::MaxReconnectAttemptsExceeded: return "PULSELINK_E120";
        case ErrorKind::ServiceDiscoveryFailed: return "PULSELINK_E201";
        case ErrorKind::CharacteristicDiscoveryFailed: return "PULSELINK_E202";
        case ErrorKind::NotificationSetupFailed: return "PULSELINK_E203";
        case ErrorKind::ConfigurationFailed: return "PULSELINK_E204";
        case ErrorKind::Timeout: return "PULSELINK_E210";
        case ErrorKind::Cancelled: return "PULSELINK_E211";
        case ErrorKind::DataCorrupted: return "PULSELINK_E301";
        case ErrorKind::InsufficientData: return "PULSELINK_E302";
    }
    return "PULSELINK_E999";
}

} // namespace pulselink
