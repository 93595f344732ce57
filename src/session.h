#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "protocol.h"
#include "usb.h"

enum class SessionState : uint8_t {
    Unopened,
    Open,
    Closed,   // terminal
};

// Transfer timing
struct SessionOptions {
    unsigned int timeout_ms       = USB_TIMEOUT_MS;
    unsigned int retry_backoff_ms = 25;
    unsigned int report_gap_ms    = 50;  // pause between the two reports
    unsigned int retries          = 1;   // extra attempts for transient errors
};

// One exclusive connection to the device.
//
// Owns its transport; sends are serialized internally, so a session may be
// shared between threads. The destructor closes the session, which keeps
// the interface claim from leaking on any exit path.
class DeviceSession {
public:
    // Session over the real libusb transport
    explicit DeviceSession(const SessionOptions& opts = SessionOptions());

    // Session over a caller-supplied transport (tests, other backends)
    explicit DeviceSession(std::unique_ptr<UsbTransport> transport,
                           const SessionOptions& opts = SessionOptions());

    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Unopened -> Open. On failure the session stays Unopened and holds no
    // handle. Throws InvalidStateError if already opened or closed.
    void open(uint16_t vid = SMARTDEVICE_VID, uint16_t pid = SMARTDEVICE_PID);

    // Send both reports of a packet. Throws InvalidStateError outside Open
    // (no I/O is attempted) and TransportError once retries are exhausted.
    void send(const CommandPacket& packet);

    // Any state -> Closed. Releases the device once; later calls do nothing.
    void close();

    SessionState state() const;

    const SessionOptions& options() const { return _opts; }

private:
    std::unique_ptr<UsbTransport> _transport;
    SessionOptions                _opts;
    SessionState                  _state = SessionState::Unopened;
    mutable std::mutex            _mutex;

    void _write_report(const Report& report, int index);
};

const char* to_string(SessionState s);
