#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "usb.h"

// -----------------------------------------------------------------------
// Smart Device LED command layout
//
// One command = two 65-byte HID output reports, always sent as a pair.
//
//  Report 0
//  Byte   | Role
//  -------|-----------------------------------------------------------------
//   0     | Report ID 0x02
//   1     | LED command opcode 0x4b
//   2     | Mode byte (see Mode)
//   3     | (direction << 4) | (moving << 3)
//   4     | (step index << 5) | ((group size - 3) << 3) | speed
//   5-61  | LED channel bytes 0..56 (19 LEDs)
//  62-64  | Padding (0x00), firmware ignores colors written here
//
//  Report 1
//   0     | Report ID 0x03
//   1-64  | LED channel bytes 57.. (zero padded)
//
// LED channels are stored per LED in G, R, B order.
// -----------------------------------------------------------------------

static constexpr uint8_t REPORT_ID_COMMAND      = 0x02;
static constexpr uint8_t REPORT_ID_CONTINUATION = 0x03;
static constexpr uint8_t OPCODE_LED             = 0x4b;

static constexpr int REPORT0_HEADER_SIZE  = 5;
static constexpr int REPORT0_COLOR_BYTES  = 57;
static constexpr int REPORT1_HEADER_SIZE  = 1;
static constexpr int REPORT1_COLOR_BYTES  = SMARTDEVICE_REPORT_SIZE - REPORT1_HEADER_SIZE;

// LEDs on the H500i/H700i strip
static constexpr std::size_t SMARTDEVICE_LED_COUNT = 20;

// Largest frame the two reports can carry
static constexpr std::size_t SMARTDEVICE_MAX_LED_COUNT =
    (REPORT0_COLOR_BYTES + REPORT1_COLOR_BYTES) / 3;

// Field widths in byte 4
static constexpr uint8_t MAX_STEP_INDEX = 0x07;  // 3 bits
static constexpr uint8_t MIN_GROUP_SIZE = 3;
static constexpr uint8_t MAX_GROUP_SIZE = 6;     // stored as size-3 in 2 bits

// Firmware mode bytes. Preset effects (one colour for the whole strip) and
// custom effects (one colour per LED) share the same byte; the capability
// table in protocol.cpp says which frames each one accepts.
enum class Mode : uint8_t {
    Fixed           = 0x00,
    Fading          = 0x01,
    SpectrumWave    = 0x02,
    Marquee         = 0x03,
    CoveringMarquee = 0x04,
    Alternating     = 0x05,
    Pulse           = 0x06,
    Breathing       = 0x07,
    Candle          = 0x09,
    Wings           = 0x0c,
    Wave            = 0x0d,
};

// Animation speed. None lets the encoder pick: 0 for static modes,
// Normal for animated ones.
enum class Speed : uint8_t {
    Slowest = 0,
    Slow    = 1,
    Normal  = 2,
    Fast    = 3,
    Fastest = 4,
    None    = 0xff,
};

enum class Direction : uint8_t {
    Forward  = 0,
    Backward = 1,
};

using StepIndex = uint8_t;

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator!=(const Color& a, const Color& b) { return !(a == b); }

// Build a Color from wider integers (CLI / config input).
// Throws EncodingError if a channel is outside 0..255.
Color make_color(int r, int g, int b);

// One colour per LED, in strip order
using LedFrame = std::vector<Color>;

// What a mode does with the optional fields of a directive
struct ModeInfo {
    Mode        mode;
    const char* name;
    bool        animated;     // speed byte is meaningful
    bool        directional;  // direction bit is meaningful
    bool        grouped;      // LED group size is meaningful
    bool        movable;      // "moving" bit is meaningful
    bool        per_led;      // accepts a different colour on every LED
};

// Returns nullptr for mode bytes the firmware does not know.
const ModeInfo* find_mode_info(Mode mode);

// One animation step
struct LedDirective {
    Mode      mode       = Mode::Fixed;
    LedFrame  frame;
    Speed     speed      = Speed::None;
    StepIndex step       = 0;
    Direction direction  = Direction::Forward;
    uint8_t   group_size = MIN_GROUP_SIZE;
    bool      moving     = false;
};

using Report = std::array<uint8_t, SMARTDEVICE_REPORT_SIZE>;

// Encoded directive, ready for DeviceSession::send
struct CommandPacket {
    std::array<Report, SMARTDEVICE_REPORT_COUNT> reports{};
};

inline bool operator==(const CommandPacket& a, const CommandPacket& b) {
    return a.reports == b.reports;
}

// -----------------------------------------------------------------------
// Encoder
//
// Pure functions; safe to call from any thread. Throw EncodingError and
// never return a partial packet.
// -----------------------------------------------------------------------

CommandPacket encode(const LedDirective& d,
                     std::size_t led_count = SMARTDEVICE_LED_COUNT);

CommandPacket encode(Mode mode, const LedFrame& frame, Speed speed, StepIndex step,
                     std::size_t led_count = SMARTDEVICE_LED_COUNT);

// Directive that switches every LED off
LedDirective off_directive(std::size_t led_count = SMARTDEVICE_LED_COUNT);

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

// Wire value of a speed for the given mode (applies the None / static rules).
// Throws EncodingError for values outside the Speed enum.
uint8_t speed_byte(Speed speed, const ModeInfo& info);

// Pretty-print both reports of a packet as a hex dump to stdout
void hexdump_packet(const CommandPacket& p, const std::string& label = "");
