#include "usb.h"
#include "errors.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

static std::string usb_error_text(int r) {
    return libusb_strerror(static_cast<libusb_error>(r));
}

std::string format_usb_id(uint16_t vid, uint16_t pid) {
    std::ostringstream ss;
    ss << std::hex << std::setw(4) << std::setfill('0') << vid
       << ":" << std::setw(4) << std::setfill('0') << pid;
    return ss.str();
}

bool is_transient_usb_error(int code) {
    return code == LIBUSB_ERROR_TIMEOUT || code == LIBUSB_ERROR_INTERRUPTED;
}

void throw_transfer_error(int code) {
    std::string what = (code == LIBUSB_ERROR_NO_DEVICE)
        ? "Device disconnected during transfer: "
        : "Interrupt transfer (send) failed: ";
    throw TransportError(what + usb_error_text(code), is_transient_usb_error(code), code);
}

void throw_open_error(int code, const std::string& step) {
    switch (code) {
    case LIBUSB_ERROR_ACCESS:
        throw DevicePermissionError("Permission denied " + step +
                                    ". Run with sudo or install the udev rule.");
    case LIBUSB_ERROR_BUSY:
        throw DeviceBusyError("Device busy " + step + ": " + usb_error_text(code));
    case LIBUSB_ERROR_NO_DEVICE:
        throw DeviceNotFoundError("Device gone " + step + ". Is the Smart Device plugged in?");
    default:
        throw TransportError("Failed " + step + ": " + usb_error_text(code), false, code);
    }
}

LibusbTransport::LibusbTransport() {
    int r = libusb_init(&_ctx);
    if (r < 0) {
        throw TransportError("libusb_init failed: " + usb_error_text(r), false, r);
    }
}

LibusbTransport::~LibusbTransport() {
    close();
    if (_ctx) {
        libusb_exit(_ctx);
        _ctx = nullptr;
    }
}

void LibusbTransport::open(uint16_t vid, uint16_t pid) {
    if (_handle) return;

    _handle = _open_matching(vid, pid);

    try {
        _claim_interface(SMARTDEVICE_INTERFACE);
    } catch (...) {
        // Undo the partial open so no handle outlives a failed open
        if (_detached) {
            libusb_attach_kernel_driver(_handle, SMARTDEVICE_INTERFACE);
            _detached = false;
        }
        libusb_close(_handle);
        _handle = nullptr;
        throw;
    }
}

void LibusbTransport::close() {
    if (!_handle) return;

    _release_interface(SMARTDEVICE_INTERFACE);

    libusb_close(_handle);
    _handle = nullptr;
}

void LibusbTransport::write(const uint8_t* data, int len, unsigned int timeout_ms) {
    if (!_handle)
        throw TransportError("write on a closed USB handle", false);

    // libusb_interrupt_transfer takes a non-const buffer even for OUT
    // transfers (it won't modify it)
    unsigned char buf[SMARTDEVICE_REPORT_SIZE];
    if (len > SMARTDEVICE_REPORT_SIZE)
        throw TransportError("report of " + std::to_string(len) +
                             " bytes exceeds " + std::to_string(SMARTDEVICE_REPORT_SIZE),
                             false);
    std::copy(data, data + len, buf);

    int transferred = 0;
    int r = libusb_interrupt_transfer(
        _handle,
        INTERRUPT_EP_OUT,
        buf,
        len,
        &transferred,
        timeout_ms);

    if (r < 0)
        throw_transfer_error(r);
    if (transferred != len) {
        throw TransportError(
            "Short write: sent " + std::to_string(transferred) +
            " bytes, expected " + std::to_string(len), true);
    }
}

// --- private helpers ---

libusb_device_handle* LibusbTransport::_open_matching(uint16_t vid, uint16_t pid) {
    // Walk the device list ourselves instead of using
    // libusb_open_device_with_vid_pid, which reports "not found" and
    // "permission denied" the same way.
    libusb_device** list = nullptr;
    ssize_t n = libusb_get_device_list(_ctx, &list);
    if (n < 0) {
        throw TransportError("libusb_get_device_list failed: " +
                             usb_error_text(static_cast<int>(n)),
                             false, static_cast<int>(n));
    }

    libusb_device_handle* handle = nullptr;
    int open_err = 0;
    for (ssize_t i = 0; i < n && !handle; ++i) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(list[i], &desc) < 0) continue;
        if (desc.idVendor != vid || desc.idProduct != pid) continue;

        open_err = libusb_open(list[i], &handle);
        if (open_err < 0) handle = nullptr;
    }
    libusb_free_device_list(list, 1);

    if (handle) return handle;

    const std::string id = format_usb_id(vid, pid);
    if (open_err < 0)
        throw_open_error(open_err, "opening device " + id);
    throw DeviceNotFoundError("Could not find device " + id +
                              ". Is the Smart Device plugged in?");
}

void LibusbTransport::_claim_interface(int iface) {
    _detached = false;

    if (libusb_kernel_driver_active(_handle, iface) == 1) {
        int r = libusb_detach_kernel_driver(_handle, iface);
        // NOT_FOUND: the driver let go on its own, nothing to reattach
        if (r < 0 && r != LIBUSB_ERROR_NOT_FOUND)
            throw_open_error(r, "detaching kernel driver from interface " +
                                std::to_string(iface));
        _detached = (r == 0);
    }

    int r = libusb_claim_interface(_handle, iface);
    if (r < 0)
        throw_open_error(r, "claiming interface " + std::to_string(iface));
}

void LibusbTransport::_release_interface(int iface) {
    int r = libusb_release_interface(_handle, iface);
    if (r < 0 && r != LIBUSB_ERROR_NO_DEVICE) {
        std::cerr << "Warning: releasing interface " << iface
                  << " failed: " << usb_error_text(r) << "\n";
    }
    if (_detached) {
        r = libusb_attach_kernel_driver(_handle, iface);
        if (r < 0 && r != LIBUSB_ERROR_NO_DEVICE) {
            std::cerr << "Warning: reattaching kernel driver to interface "
                      << iface << " failed: " << usb_error_text(r) << "\n";
        }
        _detached = false;
    }
}
