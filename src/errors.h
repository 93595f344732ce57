#pragma once

#include <stdexcept>
#include <string>

// Base class for every error raised by the encoder, transport and session.
class SmartDeviceError : public std::runtime_error {
public:
    explicit SmartDeviceError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed directive (bad frame length, unknown mode, field overflow).
// Raised before anything reaches the transport.
class EncodingError : public SmartDeviceError {
public:
    explicit EncodingError(const std::string& what) : SmartDeviceError(what) {}
};

// -----------------------------------------------------------------------
// Open-time errors. None of these are retried; they need the operator to
// plug the device in, install the udev rule or stop the other process.
// -----------------------------------------------------------------------

class DeviceNotFoundError : public SmartDeviceError {
public:
    explicit DeviceNotFoundError(const std::string& what) : SmartDeviceError(what) {}
};

class DevicePermissionError : public SmartDeviceError {
public:
    explicit DevicePermissionError(const std::string& what) : SmartDeviceError(what) {}
};

class DeviceBusyError : public SmartDeviceError {
public:
    explicit DeviceBusyError(const std::string& what) : SmartDeviceError(what) {}
};

// Failed transfer. transient() is true for timeouts, interrupted calls and
// short writes, which the session retries once.
class TransportError : public SmartDeviceError {
public:
    TransportError(const std::string& what, bool transient, int code = 0)
        : SmartDeviceError(what), _transient(transient), _code(code) {}

    bool transient() const { return _transient; }

    // libusb error code (LIBUSB_ERROR_*), 0 for short writes
    int code() const { return _code; }

private:
    bool _transient;
    int  _code;
};

// Session used outside the Open state.
class InvalidStateError : public SmartDeviceError {
public:
    explicit InvalidStateError(const std::string& what) : SmartDeviceError(what) {}
};
