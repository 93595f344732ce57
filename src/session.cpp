#include "session.h"
#include "errors.h"

#include <chrono>
#include <iostream>
#include <thread>

const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Unopened: return "unopened";
        case SessionState::Open:     return "open";
        case SessionState::Closed:   return "closed";
    }
    return "unknown";
}

DeviceSession::DeviceSession(const SessionOptions& opts)
    : DeviceSession(std::make_unique<LibusbTransport>(), opts) {}

DeviceSession::DeviceSession(std::unique_ptr<UsbTransport> transport,
                             const SessionOptions& opts)
    : _transport(std::move(transport)), _opts(opts) {
    if (!_transport)
        throw std::invalid_argument("DeviceSession needs a transport");
}

DeviceSession::~DeviceSession() {
    close();
}

void DeviceSession::open(uint16_t vid, uint16_t pid) {
    std::lock_guard<std::mutex> lock(_mutex);

    if (_state != SessionState::Unopened)
        throw InvalidStateError(std::string("open() on a session that is ") +
                                to_string(_state));

    _transport->open(vid, pid);
    _state = SessionState::Open;
}

void DeviceSession::send(const CommandPacket& packet) {
    std::lock_guard<std::mutex> lock(_mutex);

    if (_state != SessionState::Open)
        throw InvalidStateError(std::string("send() on a session that is ") +
                                to_string(_state));

    for (int i = 0; i < SMARTDEVICE_REPORT_COUNT; ++i) {
        if (i > 0 && _opts.report_gap_ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(_opts.report_gap_ms));
        _write_report(packet.reports[i], i);
    }
}

void DeviceSession::close() {
    std::lock_guard<std::mutex> lock(_mutex);

    if (_state == SessionState::Closed) return;

    if (_state == SessionState::Open)
        _transport->close();
    _state = SessionState::Closed;
}

SessionState DeviceSession::state() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

// --- private helpers ---

void DeviceSession::_write_report(const Report& report, int index) {
    for (unsigned int attempt = 0; ; ++attempt) {
        try {
            _transport->write(report.data(), static_cast<int>(report.size()),
                              _opts.timeout_ms);
            return;
        } catch (const TransportError& e) {
            if (!e.transient() || attempt >= _opts.retries)
                throw;
            std::cerr << "Warning: report " << index << ": " << e.what()
                      << ", retrying in " << _opts.retry_backoff_ms << " ms\n";
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(_opts.retry_backoff_ms));
    }
}
