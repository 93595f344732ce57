/*
 * test_helpers.h - Shared fixtures for the native unit tests
 *
 * FakeTransport stands in for the libusb transport so the session state
 * machine and retry logic run on the host without a device attached.
 */
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

#include "errors.h"
#include "protocol.h"
#include "usb.h"

// True if calling f throws an exception of type E
template <typename E, typename F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

// Counters live outside the transport so a test can still read them after
// the session that owns the transport has been destroyed.
struct FakeStats {
    int open_calls  = 0;
    int close_calls = 0;
    int write_calls = 0;
    uint16_t vid = 0;
    uint16_t pid = 0;
    std::vector<std::vector<uint8_t>> written;
};

// What the next open() / write() does
enum class FakeOpen { Ok, NotFound, Permission, Busy };
enum class FakeWrite { Ok, Timeout, ShortWrite, NoDevice };

class FakeTransport : public UsbTransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeStats> stats) : _stats(std::move(stats)) {}

    void fail_open(FakeOpen how) { _open_result = how; }
    void queue_write(FakeWrite how) { _writes.push_back(how); }

    void open(uint16_t vid, uint16_t pid) override {
        ++_stats->open_calls;
        _stats->vid = vid;
        _stats->pid = pid;
        switch (_open_result) {
            case FakeOpen::NotFound:   throw DeviceNotFoundError("no such device");
            case FakeOpen::Permission: throw DevicePermissionError("access denied");
            case FakeOpen::Busy:       throw DeviceBusyError("interface claimed");
            case FakeOpen::Ok:         break;
        }
        _open = true;
    }

    void write(const uint8_t* data, int len, unsigned int) override {
        ++_stats->write_calls;
        FakeWrite how = FakeWrite::Ok;
        if (!_writes.empty()) {
            how = _writes.front();
            _writes.pop_front();
        }
        switch (how) {
            case FakeWrite::Timeout:
                throw_transfer_error(LIBUSB_ERROR_TIMEOUT);
            case FakeWrite::ShortWrite:
                throw TransportError("short write", true);
            case FakeWrite::NoDevice:
                throw_transfer_error(LIBUSB_ERROR_NO_DEVICE);
            case FakeWrite::Ok:
                break;
        }
        _stats->written.emplace_back(data, data + len);
    }

    void close() override {
        if (!_open) return;
        ++_stats->close_calls;
        _open = false;
    }

    bool is_open() const override { return _open; }

private:
    std::shared_ptr<FakeStats> _stats;
    FakeOpen                   _open_result = FakeOpen::Ok;
    std::deque<FakeWrite>      _writes;
    bool                       _open = false;
};

inline LedFrame solid(Color c, std::size_t n = SMARTDEVICE_LED_COUNT) {
    return LedFrame(n, c);
}
