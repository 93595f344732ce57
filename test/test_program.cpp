/*
 * test_program.cpp - Native unit tests for the named effects
 *
 * Checks how each effect expands colours into steps, and that
 * run_program() encodes everything before the first send.
 */
#include <unity.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "program.h"
#include "session.h"
#include "test_helpers.h"

void setUp(void) {}
void tearDown(void) {}

static const Color RED   = {255, 0, 0};
static const Color GREEN = {0, 255, 0};
static const Color BLUE  = {0, 0, 255};

// =============================================================================
// build_program
// =============================================================================

static void test_fixed_is_one_uniform_step(void) {
    auto prog = build_program("fixed", {RED});
    TEST_ASSERT_EQUAL(1, prog.size());
    TEST_ASSERT_TRUE(prog[0].mode == Mode::Fixed);
    TEST_ASSERT_EQUAL(SMARTDEVICE_LED_COUNT, prog[0].frame.size());
    for (auto& c : prog[0].frame)
        TEST_ASSERT_TRUE(c == RED);
}

static void test_breathing_gives_one_step_per_color(void) {
    ProgramOptions opts;
    opts.speed = Speed::Slow;
    auto prog = build_program("breathing", {RED, GREEN, BLUE}, opts);
    TEST_ASSERT_EQUAL(3, prog.size());
    for (std::size_t i = 0; i < prog.size(); ++i) {
        TEST_ASSERT_EQUAL(i, prog[i].step);
        TEST_ASSERT_TRUE(prog[i].mode == Mode::Breathing);
        TEST_ASSERT_TRUE(prog[i].speed == Speed::Slow);
    }
    TEST_ASSERT_TRUE(prog[2].frame[0] == BLUE);
}

static void test_sequence_limited_to_eight_colors(void) {
    std::vector<Color> nine(9, RED);
    TEST_ASSERT_TRUE(throws<std::invalid_argument>([&] { build_program("fading", nine); }));
    std::vector<Color> eight(8, RED);
    auto prog = build_program("fading", eight);
    TEST_ASSERT_EQUAL(7, prog.back().step);
}

static void test_alternating_needs_two_colors(void) {
    TEST_ASSERT_TRUE(throws<std::invalid_argument>([] { build_program("alternating", {RED}); }));

    ProgramOptions opts;
    opts.moving = true;
    opts.size   = 4;
    auto prog = build_program("alternating", {RED, BLUE}, opts);
    TEST_ASSERT_EQUAL(2, prog.size());
    TEST_ASSERT_EQUAL(0, prog[0].step);
    TEST_ASSERT_EQUAL(1, prog[1].step);
    TEST_ASSERT_TRUE(prog[1].moving);
    TEST_ASSERT_EQUAL(4, prog[1].group_size);
    TEST_ASSERT_TRUE(prog[1].frame[0] == BLUE);
}

static void test_marquee_checks_size(void) {
    ProgramOptions opts;
    opts.size = 7;
    TEST_ASSERT_TRUE(throws<std::invalid_argument>([&] { build_program("marquee", {RED}, opts); }));
    opts.size = 2;
    TEST_ASSERT_TRUE(throws<std::invalid_argument>([&] { build_program("marquee", {RED}, opts); }));
}

static void test_spectrum_wave_takes_no_color(void) {
    TEST_ASSERT_TRUE(throws<std::invalid_argument>([] { build_program("spectrum_wave", {RED}); }));
    auto prog = build_program("spectrum_wave", {});
    TEST_ASSERT_EQUAL(1, prog.size());
    TEST_ASSERT_TRUE(prog[0].mode == Mode::SpectrumWave);
    encode(prog[0]);
}

static void test_off_is_all_black_fixed(void) {
    auto prog = build_program("off", {});
    TEST_ASSERT_EQUAL(1, prog.size());
    TEST_ASSERT_TRUE(encode(prog[0]) == encode(off_directive()));
}

static void test_custom_pads_missing_leds_with_black(void) {
    auto prog = build_program("custom_fixed", {RED, GREEN});
    TEST_ASSERT_EQUAL(1, prog.size());
    TEST_ASSERT_TRUE(prog[0].frame[0] == RED);
    TEST_ASSERT_TRUE(prog[0].frame[1] == GREEN);
    for (std::size_t i = 2; i < prog[0].frame.size(); ++i)
        TEST_ASSERT_TRUE(prog[0].frame[i] == Color{});
}

static void test_custom_rejects_more_colors_than_leds(void) {
    std::vector<Color> many(SMARTDEVICE_LED_COUNT + 1, RED);
    TEST_ASSERT_TRUE(throws<std::invalid_argument>([&] { build_program("custom_wave", many); }));
}

static void test_custom_follows_led_count(void) {
    auto prog = build_program("custom_breathing", {RED}, ProgramOptions(), 8);
    TEST_ASSERT_EQUAL(8, prog[0].frame.size());
    encode(prog[0], 8);
}

static void test_unknown_effect(void) {
    TEST_ASSERT_FALSE(is_program_name("disco"));
    TEST_ASSERT_TRUE(is_program_name("candle"));
    TEST_ASSERT_TRUE(throws<std::invalid_argument>([] { build_program("disco", {RED}); }));
}

static void test_every_effect_encodes(void) {
    const char* single[] = {"fixed", "marquee", "wings", "candle"};
    for (const char* name : single)
        for (auto& d : build_program(name, {GREEN}))
            encode(d);

    const char* seq[] = {"breathing", "fading", "pulse", "covering_marquee"};
    for (const char* name : seq)
        for (auto& d : build_program(name, {RED, GREEN}))
            encode(d);

    const char* custom[] = {"custom_fixed", "custom_breathing", "custom_wave"};
    for (const char* name : custom)
        for (auto& d : build_program(name, {RED, GREEN, BLUE}))
            encode(d);
}

// =============================================================================
// run_program
// =============================================================================

static void test_run_program_sends_steps_in_order(void) {
    auto stats = std::make_shared<FakeStats>();
    SessionOptions o;
    o.report_gap_ms = 0;
    DeviceSession session(std::make_unique<FakeTransport>(stats), o);
    session.open();

    run_program(session, build_program("pulse", {RED, GREEN, BLUE}));

    TEST_ASSERT_EQUAL(6, stats->written.size());
    TEST_ASSERT_EQUAL_HEX8(0x02, stats->written[0][4]);  // step 0, speed normal
    TEST_ASSERT_EQUAL_HEX8(0x22, stats->written[2][4]);  // step 1
    TEST_ASSERT_EQUAL_HEX8(0x42, stats->written[4][4]);  // step 2
}

static void test_run_program_encodes_before_sending(void) {
    auto stats = std::make_shared<FakeStats>();
    DeviceSession session(std::make_unique<FakeTransport>(stats));
    session.open();

    std::vector<LedDirective> prog = build_program("fading", {RED, GREEN});
    prog[1].frame.pop_back();

    TEST_ASSERT_TRUE(throws<EncodingError>([&] { run_program(session, prog); }));
    TEST_ASSERT_EQUAL(0, stats->write_calls);
}

static void test_encode_program_matches_per_step_encode(void) {
    auto prog = build_program("fading", {RED, GREEN}, ProgramOptions(), 12);
    std::vector<CommandPacket> packets = encode_program(prog, 12);
    TEST_ASSERT_EQUAL(2, packets.size());
    TEST_ASSERT_TRUE(packets[0] == encode(prog[0], 12));
    TEST_ASSERT_TRUE(packets[1] == encode(prog[1], 12));
}

static void test_run_program_sends_encoded_packets_unchanged(void) {
    auto stats = std::make_shared<FakeStats>();
    SessionOptions o;
    o.report_gap_ms = 0;
    DeviceSession session(std::make_unique<FakeTransport>(stats), o);
    session.open();

    std::vector<CommandPacket> packets = encode_program(build_program("alternating", {RED, BLUE}));
    run_program(session, packets);

    TEST_ASSERT_EQUAL(4, stats->written.size());
    TEST_ASSERT_EQUAL_UINT8_ARRAY(packets[1].reports[0].data(), stats->written[2].data(), 65);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(packets[1].reports[1].data(), stats->written[3].data(), 65);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_fixed_is_one_uniform_step);
    RUN_TEST(test_breathing_gives_one_step_per_color);
    RUN_TEST(test_sequence_limited_to_eight_colors);
    RUN_TEST(test_alternating_needs_two_colors);
    RUN_TEST(test_marquee_checks_size);
    RUN_TEST(test_spectrum_wave_takes_no_color);
    RUN_TEST(test_off_is_all_black_fixed);
    RUN_TEST(test_custom_pads_missing_leds_with_black);
    RUN_TEST(test_custom_rejects_more_colors_than_leds);
    RUN_TEST(test_custom_follows_led_count);
    RUN_TEST(test_unknown_effect);
    RUN_TEST(test_every_effect_encodes);

    RUN_TEST(test_encode_program_matches_per_step_encode);
    RUN_TEST(test_run_program_sends_steps_in_order);
    RUN_TEST(test_run_program_sends_encoded_packets_unchanged);
    RUN_TEST(test_run_program_encodes_before_sending);

    return UNITY_END();
}
