#include "program.h"
#include "session.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

// How an effect turns user colours into frames
enum class Layout {
    None,      // no colour argument, fixed frame
    Single,    // exactly one colour, whole strip
    Sequence,  // one step per colour, whole strip
    Pair,      // exactly two colours, two steps
    PerLed,    // one colour per LED, single step
};

struct Effect {
    const char* name;
    Mode        mode;
    Layout      layout;
    const char* help;
};

static const Effect effects[] = {
    {"off",              Mode::Fixed,           Layout::None,     "turn off all leds"},
    {"fixed",            Mode::Fixed,           Layout::Single,   "fixed color for all leds"},
    {"breathing",        Mode::Breathing,       Layout::Sequence, "fade brightness in, out and then change color"},
    {"fading",           Mode::Fading,          Layout::Sequence, "fade between given colors"},
    {"marquee",          Mode::Marquee,         Layout::Single,   "moving row of leds"},
    {"covering_marquee", Mode::CoveringMarquee, Layout::Sequence, "marquee consisting of multiple colors"},
    {"pulse",            Mode::Pulse,           Layout::Sequence, "fade color out and then show next color with full brightness"},
    {"spectrum_wave",    Mode::SpectrumWave,    Layout::None,     "(hard coded) rgb marquee"},
    {"alternating",      Mode::Alternating,     Layout::Pair,     "alternate led rows between two colors"},
    {"wings",            Mode::Wings,           Layout::Single,   "symmetric marquee (looks like flapping wings)"},
    {"candle",           Mode::Candle,          Layout::Single,   "flickering candle"},
    {"custom_fixed",     Mode::Fixed,           Layout::PerLed,   "set each led to a fixed color"},
    {"custom_breathing", Mode::Breathing,       Layout::PerLed,   "breathing but with a different color for each led"},
    {"custom_wave",      Mode::Wave,            Layout::PerLed,   "marquee with different colors for each led"},
};

static const Effect* find_effect(const std::string& name) {
    for (auto& e : effects)
        if (name == e.name) return &e;
    return nullptr;
}

// spectrum_wave draws from the firmware palette; the frame it still
// carries is filled with the preset default colour.
static const Color default_color = {0, 0, 255};

static void expect_colors(const Effect& e, const std::vector<Color>& colors,
                          std::size_t min, std::size_t max) {
    if (colors.size() >= min && colors.size() <= max) return;
    std::string want = (min == max) ? std::to_string(min)
                                    : std::to_string(min) + "-" + std::to_string(max);
    throw std::invalid_argument(std::string(e.name) + " takes " + want +
                                " color(s), got " + std::to_string(colors.size()));
}

static LedDirective make_step(const Effect& e, LedFrame frame, StepIndex step,
                              const ProgramOptions& opts) {
    LedDirective d;
    d.mode       = e.mode;
    d.frame      = std::move(frame);
    d.speed      = opts.speed;
    d.step       = step;
    d.direction  = opts.direction;
    d.group_size = opts.size;
    d.moving     = opts.moving;
    return d;
}

static std::string flags_for(Mode mode) {
    const ModeInfo* info = find_mode_info(mode);
    std::string flags;
    auto add = [&](const char* f) {
        if (!flags.empty()) flags += ", ";
        flags += f;
    };
    if (info->animated)    add("speed");
    if (info->directional) add("direction");
    if (info->grouped)     add("size");
    if (info->movable)     add("moving");
    return flags;
}

// -----------------------------------------------------------------------
// build_program
// -----------------------------------------------------------------------

std::vector<LedDirective> build_program(const std::string& name,
                                        const std::vector<Color>& colors,
                                        const ProgramOptions& opts,
                                        std::size_t led_count) {
    const Effect* e = find_effect(name);
    if (!e)
        throw std::invalid_argument("Unknown effect '" + name + "'");

    if (find_mode_info(e->mode)->grouped &&
        (opts.size < MIN_GROUP_SIZE || opts.size > MAX_GROUP_SIZE))
        throw std::invalid_argument("size has to be between 3 and 6");

    std::vector<LedDirective> program;

    switch (e->layout) {
    case Layout::None:
        expect_colors(*e, colors, 0, 0);
        if (e->mode == Mode::Fixed)
            program.push_back(off_directive(led_count));
        else
            program.push_back(make_step(*e, LedFrame(led_count, default_color), 0, opts));
        break;

    case Layout::Single:
        expect_colors(*e, colors, 1, 1);
        program.push_back(make_step(*e, LedFrame(led_count, colors[0]), 0, opts));
        break;

    case Layout::Sequence:
        expect_colors(*e, colors, 1, MAX_STEP_INDEX + 1u);
        for (std::size_t i = 0; i < colors.size(); ++i)
            program.push_back(make_step(*e, LedFrame(led_count, colors[i]),
                                        static_cast<StepIndex>(i), opts));
        break;

    case Layout::Pair:
        expect_colors(*e, colors, 2, 2);
        program.push_back(make_step(*e, LedFrame(led_count, colors[0]), 0, opts));
        program.push_back(make_step(*e, LedFrame(led_count, colors[1]), 1, opts));
        break;

    case Layout::PerLed: {
        expect_colors(*e, colors, 1, led_count);
        LedFrame frame(colors.begin(), colors.end());
        frame.resize(led_count, Color{});
        program.push_back(make_step(*e, std::move(frame), 0, opts));
        break;
    }
    }

    return program;
}

// -----------------------------------------------------------------------
// encode_program / run_program
// -----------------------------------------------------------------------

std::vector<CommandPacket> encode_program(const std::vector<LedDirective>& program,
                                          std::size_t led_count) {
    std::vector<CommandPacket> packets;
    packets.reserve(program.size());
    for (auto& d : program)
        packets.push_back(encode(d, led_count));
    return packets;
}

void run_program(DeviceSession& session, const std::vector<CommandPacket>& packets) {
    for (auto& p : packets)
        session.send(p);
}

void run_program(DeviceSession& session,
                 const std::vector<LedDirective>& program,
                 std::size_t led_count) {
    run_program(session, encode_program(program, led_count));
}

bool is_program_name(const std::string& name) {
    return find_effect(name) != nullptr;
}

// -----------------------------------------------------------------------
// list_programs
// -----------------------------------------------------------------------

void list_programs() {
    std::size_t width = 23;
    for (auto& e : effects)
        width = std::max(width, std::string(e.name).size() + 2);

    std::cout << "effects (allowed flags):\n";
    for (auto& e : effects) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << e.name
                  << e.help << " (" << flags_for(e.mode) << ")\n";
    }
    std::cout << std::right;
}
