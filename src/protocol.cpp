#include "protocol.h"
#include "errors.h"

#include <iomanip>
#include <iostream>
#include <sstream>

// -----------------------------------------------------------------------
// Mode capability table
//
// Preset-only modes (per_led == false) animate a single colour; the
// firmware ignores per-LED differences, so non-uniform frames are refused
// instead of being silently flattened.
// -----------------------------------------------------------------------
static const ModeInfo mode_table[] = {
    //  mode                   name                animated dir    grouped movable per_led
    {Mode::Fixed,           "fixed",            false, false, false, false, true },
    {Mode::Fading,          "fading",           true,  false, false, false, true },
    {Mode::SpectrumWave,    "spectrum_wave",    true,  true,  false, false, false},
    {Mode::Marquee,         "marquee",          true,  true,  true,  false, true },
    {Mode::CoveringMarquee, "covering_marquee", true,  true,  false, false, true },
    {Mode::Alternating,     "alternating",      true,  true,  true,  true,  false},
    {Mode::Pulse,           "pulse",            true,  false, false, false, true },
    {Mode::Breathing,       "breathing",        true,  false, false, false, true },
    {Mode::Candle,          "candle",           false, false, false, false, false},
    {Mode::Wings,           "wings",            true,  false, false, false, true },
    {Mode::Wave,            "wave",             true,  false, false, false, true },
};

const ModeInfo* find_mode_info(Mode mode) {
    for (auto& e : mode_table)
        if (e.mode == mode) return &e;
    return nullptr;
}

Color make_color(int r, int g, int b) {
    auto check = [](int v, const char* channel) {
        if (v < 0 || v > 255)
            throw EncodingError(std::string("Color channel ") + channel + " = " +
                                std::to_string(v) + " is out of range (0-255)");
        return static_cast<uint8_t>(v);
    };
    Color c;
    c.r = check(r, "R");
    c.g = check(g, "G");
    c.b = check(b, "B");
    return c;
}

uint8_t speed_byte(Speed speed, const ModeInfo& info) {
    switch (speed) {
        case Speed::Slowest:
        case Speed::Slow:
        case Speed::Normal:
        case Speed::Fast:
        case Speed::Fastest:
        case Speed::None:
            break;
        default:
            throw EncodingError("Unknown speed value " +
                                std::to_string(static_cast<int>(speed)));
    }

    // Static modes have no timing; the firmware expects 0 there
    if (!info.animated) return 0;
    if (speed == Speed::None) return static_cast<uint8_t>(Speed::Normal);
    return static_cast<uint8_t>(speed);
}

// -----------------------------------------------------------------------
// Encoder
// -----------------------------------------------------------------------

static void check_directive(const LedDirective& d, const ModeInfo* info,
                            std::size_t led_count) {
    if (!info)
        throw EncodingError("Unknown LED mode 0x" + [&] {
            std::ostringstream s;
            s << std::hex << std::setw(2) << std::setfill('0')
              << static_cast<int>(d.mode);
            return s.str();
        }());

    if (led_count == 0 || led_count > SMARTDEVICE_MAX_LED_COUNT)
        throw EncodingError("LED count " + std::to_string(led_count) +
                            " is out of range (1-" +
                            std::to_string(SMARTDEVICE_MAX_LED_COUNT) + ")");

    if (d.frame.size() != led_count)
        throw EncodingError("Frame has " + std::to_string(d.frame.size()) +
                            " colors, the device has " + std::to_string(led_count) +
                            " LEDs");

    if (d.step > MAX_STEP_INDEX)
        throw EncodingError("Step index " + std::to_string(d.step) +
                            " does not fit the 3-bit field (0-7)");

    if (d.direction != Direction::Forward && d.direction != Direction::Backward)
        throw EncodingError("Unknown direction value " +
                            std::to_string(static_cast<int>(d.direction)));

    if (info->grouped &&
        (d.group_size < MIN_GROUP_SIZE || d.group_size > MAX_GROUP_SIZE))
        throw EncodingError("LED group size " + std::to_string(d.group_size) +
                            " is out of range (3-6)");

    if (!info->per_led) {
        for (auto& c : d.frame)
            if (c != d.frame.front())
                throw EncodingError(std::string("Mode '") + info->name +
                                    "' needs the same color on every LED");
    }
}

CommandPacket encode(const LedDirective& d, std::size_t led_count) {
    const ModeInfo* info = find_mode_info(d.mode);
    check_directive(d, info, led_count);

    uint8_t speed = speed_byte(d.speed, *info);
    uint8_t dir   = info->directional ? static_cast<uint8_t>(d.direction) : 0;
    uint8_t group = info->grouped ? static_cast<uint8_t>(d.group_size - MIN_GROUP_SIZE) : 0;
    uint8_t moving = (info->movable && d.moving) ? 1 : 0;

    CommandPacket p;
    Report& r0 = p.reports[0];
    Report& r1 = p.reports[1];

    r0[0] = REPORT_ID_COMMAND;
    r0[1] = OPCODE_LED;
    r0[2] = static_cast<uint8_t>(d.mode);
    r0[3] = static_cast<uint8_t>((dir << 4) | (moving << 3));
    r0[4] = static_cast<uint8_t>((d.step << 5) | (group << 3) | speed);

    r1[0] = REPORT_ID_CONTINUATION;

    // Channel byte k lands in report 0 while k < 57, then continues in
    // report 1 right after its report ID.
    int k = 0;
    auto put = [&](uint8_t v) {
        if (k < REPORT0_COLOR_BYTES)
            r0[REPORT0_HEADER_SIZE + k] = v;
        else
            r1[REPORT1_HEADER_SIZE + (k - REPORT0_COLOR_BYTES)] = v;
        ++k;
    };
    for (auto& c : d.frame) {
        put(c.g);
        put(c.r);
        put(c.b);
    }

    return p;
}

CommandPacket encode(Mode mode, const LedFrame& frame, Speed speed, StepIndex step,
                     std::size_t led_count) {
    LedDirective d;
    d.mode  = mode;
    d.frame = frame;
    d.speed = speed;
    d.step  = step;
    return encode(d, led_count);
}

LedDirective off_directive(std::size_t led_count) {
    LedDirective d;
    d.mode  = Mode::Fixed;
    d.frame = LedFrame(led_count, Color{});
    return d;
}

// -----------------------------------------------------------------------
// Debug output
// -----------------------------------------------------------------------

void hexdump_packet(const CommandPacket& p, const std::string& label) {
    if (!label.empty())
        std::cout << label << "\n";
    std::cout << std::hex << std::setfill('0');
    for (std::size_t r = 0; r < p.reports.size(); ++r) {
        const Report& rep = p.reports[r];
        for (std::size_t i = 0; i < rep.size(); i += 16) {
            std::cout << "  [" << r << "] " << std::setw(2) << i << ": ";
            for (std::size_t j = i; j < i + 16 && j < rep.size(); ++j)
                std::cout << std::setw(2) << static_cast<int>(rep[j]) << " ";
            std::cout << "\n";
        }
    }
    std::cout << std::dec << std::setfill(' ');
}
