#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "protocol.h"

class DeviceSession;

// User-facing knobs shared by all effects. Effects ignore the ones they
// have no use for (see list_programs()).
struct ProgramOptions {
    Speed     speed     = Speed::Normal;
    Direction direction = Direction::Forward;
    uint8_t   size      = MIN_GROUP_SIZE;  // LED group length, 3-6
    bool      moving    = false;
};

// Expand a named effect and its colours into one directive per animation
// step, indexed from 0.
//
// Supports:
//   - off, fixed, candle, wings, marquee:            one colour
//   - breathing, fading, pulse, covering_marquee:    1-8 colours, one step each
//   - alternating:                                   exactly two colours
//   - spectrum_wave:                                 no colour (firmware palette)
//   - custom_fixed, custom_breathing, custom_wave:   one colour per LED,
//                                                    missing LEDs stay dark
//
// Throws std::invalid_argument for unknown names, wrong colour counts and
// a group size outside 3-6.
std::vector<LedDirective> build_program(const std::string& name,
                                        const std::vector<Color>& colors,
                                        const ProgramOptions& opts = ProgramOptions(),
                                        std::size_t led_count = SMARTDEVICE_LED_COUNT);

// Encode every step of a program. Throws EncodingError on the first bad
// step, before the caller has sent anything.
std::vector<CommandPacket> encode_program(const std::vector<LedDirective>& program,
                                          std::size_t led_count = SMARTDEVICE_LED_COUNT);

// Send already encoded steps in order
void run_program(DeviceSession& session, const std::vector<CommandPacket>& packets);

// encode_program() then run_program(): an encoding error reaches the
// caller before any byte goes out.
void run_program(DeviceSession& session,
                 const std::vector<LedDirective>& program,
                 std::size_t led_count = SMARTDEVICE_LED_COUNT);

// True if `name` is a known effect
bool is_program_name(const std::string& name);

// Print all effects with their description and honoured flags (--list-effects)
void list_programs();
