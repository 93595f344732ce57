#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <libusb.h>

// NZXT Smart Device (H500i / H700i LED and fan controller) USB identifiers
static constexpr uint16_t SMARTDEVICE_VID = 0x1e71;
static constexpr uint16_t SMARTDEVICE_PID = 0x1714;

// Every LED command is carried by two HID output reports of this size
static constexpr int SMARTDEVICE_REPORT_SIZE  = 65;
static constexpr int SMARTDEVICE_REPORT_COUNT = 2;

// HID interface holding the LED channel, and its interrupt OUT endpoint
static constexpr int     SMARTDEVICE_INTERFACE = 0;
static constexpr uint8_t INTERRUPT_EP_OUT      = 0x01;

// Default timeout for USB transfers in milliseconds
static constexpr unsigned int USB_TIMEOUT_MS = 200;

// Byte transport to one USB device. DeviceSession talks to the hardware
// only through this interface so the state machine can be exercised
// without a device attached.
class UsbTransport {
public:
    virtual ~UsbTransport() = default;

    // Find the device by VID/PID and claim its LED interface.
    // Throws DeviceNotFoundError, DevicePermissionError or DeviceBusyError.
    virtual void open(uint16_t vid, uint16_t pid) = 0;

    // Write one report. Throws TransportError on failure or short write.
    virtual void write(const uint8_t* data, int len, unsigned int timeout_ms) = 0;

    // Release the interface and the handle. Calling it again is a no-op.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

class LibusbTransport : public UsbTransport {
public:
    LibusbTransport();
    ~LibusbTransport() override;

    // Non-copyable
    LibusbTransport(const LibusbTransport&) = delete;
    LibusbTransport& operator=(const LibusbTransport&) = delete;

    // Open the device by VID/PID (detaches kernel driver automatically)
    void open(uint16_t vid, uint16_t pid) override;

    // Interrupt transfer to INTERRUPT_EP_OUT
    void write(const uint8_t* data, int len, unsigned int timeout_ms) override;

    // Release the interface and reattach the kernel driver
    void close() override;

    bool is_open() const override { return _handle != nullptr; }

private:
    libusb_context*       _ctx    = nullptr;
    libusb_device_handle* _handle = nullptr;

    bool _detached = false;

    libusb_device_handle* _open_matching(uint16_t vid, uint16_t pid);
    void _claim_interface(int iface);
    void _release_interface(int iface);
};

// "1e71:1714"
std::string format_usb_id(uint16_t vid, uint16_t pid);

// -----------------------------------------------------------------------
// libusb error classification
// -----------------------------------------------------------------------

// Transfer failures worth one more attempt: timeouts and interrupted calls
bool is_transient_usb_error(int code);

// Throw the TransportError for a failed interrupt transfer
void throw_transfer_error(int code);

// Throw the error for a libusb failure while opening or claiming the
// device (`step` names what was being done):
//   ACCESS    -> DevicePermissionError
//   BUSY      -> DeviceBusyError
//   NO_DEVICE -> DeviceNotFoundError (unplugged after enumeration)
//   other     -> TransportError, not transient
void throw_open_error(int code, const std::string& step);
