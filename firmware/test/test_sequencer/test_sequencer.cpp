// =====================================================
// Sequencer Unit Tests
// =====================================================
// Queueing, stepping, polarity and pin failure handling
// against MockOutputPin.
//
// Run natively: ctest (see CMakeLists.txt)
// =====================================================

#include <unity.h>
#include <string.h>
#include "sequencer.h"
#include "patterns.h"
#include "../mock_output_pin.h"

// =====================================================
// Test Fixtures
// =====================================================

MockOutputPin pin;

void setUp() {
    pin.reset();
}

void tearDown() {
}

// Step once per character and check the pin level ('1' = high)
static void assertDrives(Sequencer& seq, const char* expected) {
    for (const char* p = expected; *p; ++p) {
        seq.step();
        TEST_ASSERT_EQUAL_MESSAGE(*p == '1', pin.high, expected);
    }
}

// =====================================================
// Construction / Idle
// =====================================================

void test_construct_drives_inactive_level() {
    StaticSequencer<1> seq(pin, false);

    TEST_ASSERT_EQUAL(1, (int)pin.writeCount);
    TEST_ASSERT_EQUAL(1, pin.lowCount);
    TEST_ASSERT_FALSE(pin.high);
    TEST_ASSERT_FALSE(seq.activeLow());
}

void test_construct_active_low_drives_high() {
    StaticSequencer<1> seq(pin, true);

    TEST_ASSERT_EQUAL(1, (int)pin.writeCount);
    TEST_ASSERT_EQUAL(1, pin.highCount);
    TEST_ASSERT_TRUE(pin.high);
    TEST_ASSERT_TRUE(seq.activeLow());
}

void test_construct_ignores_pin_failure() {
    pin.failWrites = true;
    StaticSequencer<2> seq(pin, false);

    TEST_ASSERT_TRUE(seq.idle());
    TEST_ASSERT_EQUAL(2, (int)seq.capacity());
}

void test_idle_lifecycle() {
    StaticSequencer<2> seq(pin, false);
    TEST_ASSERT_TRUE(seq.idle());

    seq.enqueue(Pattern::fromRaw(0b10, 2));
    TEST_ASSERT_FALSE(seq.idle());

    seq.step();
    TEST_ASSERT_FALSE(seq.idle());  // one step left in the current pattern

    seq.step();
    TEST_ASSERT_TRUE(seq.idle());
}

// =====================================================
// Stepping
// =====================================================

void test_single_pattern_then_inactive() {
    StaticSequencer<1> seq(pin, false);
    seq.enqueue(Pattern::fromRaw(0b101, 3));

    assertDrives(seq, "101");
    TEST_ASSERT_TRUE(seq.idle());

    // Queue empty: held inactive
    assertDrives(seq, "0");
    TEST_ASSERT_TRUE(seq.idle());
}

void test_step_when_idle_keeps_driving_inactive() {
    StaticSequencer<1> seq(pin, false);
    size_t before = pin.writeCount;

    seq.step();
    seq.step();

    TEST_ASSERT_EQUAL((int)before + 2, (int)pin.writeCount);
    TEST_ASSERT_FALSE(pin.high);
}

void test_sos() {
    StaticSequencer<1> seq(pin, false);
    seq.enqueue(patterns::morse::SOS);

    assertDrives(seq, "101010" "110110110" "101010");
    TEST_ASSERT_TRUE(seq.idle());
}

void test_queued_patterns_play_back_to_back() {
    StaticSequencer<3> seq(pin, false);
    const Pattern p = Pattern::fromRaw(0b101, 3);

    TEST_ASSERT_TRUE(seq.tryEnqueue(p));
    TEST_ASSERT_TRUE(seq.tryEnqueue(p));
    TEST_ASSERT_TRUE(seq.tryEnqueue(p));

    assertDrives(seq, "101" "101" "101");
    TEST_ASSERT_TRUE(seq.idle());
}

void test_queued_sos_three_times() {
    StaticSequencer<3> seq(pin, false);
    seq.enqueue(patterns::morse::SOS);
    seq.enqueue(patterns::morse::SOS);
    seq.enqueue(patterns::morse::SOS);

    for (int i = 0; i < 3; i++) {
        assertDrives(seq, "101010" "110110110" "101010");
    }
    TEST_ASSERT_TRUE(seq.idle());
}

void test_library_pattern_unchanged_after_play() {
    StaticSequencer<1> seq(pin, false);
    const Pattern before = patterns::morse::H;

    seq.enqueue(patterns::morse::H);
    seq.step();
    seq.step();
    seq.step();

    TEST_ASSERT_TRUE(patterns::morse::H == before);
}

void test_zero_length_patterns_are_skipped() {
    StaticSequencer<3> seq(pin, false);
    seq.enqueue(Pattern());
    seq.enqueue(Pattern::fromRaw(0xFF, 0));
    seq.enqueue(Pattern::fromRaw(0b1, 1));

    // First step already comes from the 1-step pattern
    assertDrives(seq, "1");
    TEST_ASSERT_TRUE(seq.idle());
}

void test_only_empty_patterns_leave_sequencer_idle() {
    StaticSequencer<2> seq(pin, false);
    seq.enqueue(Pattern());
    TEST_ASSERT_FALSE(seq.idle());

    assertDrives(seq, "0");
    TEST_ASSERT_TRUE(seq.idle());
    TEST_ASSERT_EQUAL(0, (int)seq.pending());
}

void test_full_width_pattern_plays_all_steps() {
    StaticSequencer<1> seq(pin, false);
    seq.enqueue(Pattern::fromRaw(0xFFFFFFFF, 32));

    for (int i = 0; i < 32; i++) {
        TEST_ASSERT_FALSE(seq.idle());
        seq.step();
        TEST_ASSERT_TRUE(pin.high);
    }
    TEST_ASSERT_TRUE(seq.idle());
}

// =====================================================
// Polarity
// =====================================================

void test_active_low_inverts_every_step() {
    StaticSequencer<1> seq(pin, true);
    seq.enqueue(Pattern::fromRaw(0b1101, 4));

    assertDrives(seq, "0010");

    // Inactive is high when active-low
    assertDrives(seq, "1");
}

// =====================================================
// Queue Capacity
// =====================================================

void test_try_enqueue_returns_rejected_pattern() {
    StaticSequencer<2> seq(pin, false);
    const Pattern extra = Pattern::fromRaw(0b111000111, 9);
    Pattern rejected;

    TEST_ASSERT_TRUE(seq.tryEnqueue(patterns::morse::E));
    TEST_ASSERT_TRUE(seq.tryEnqueue(patterns::morse::T));

    TEST_ASSERT_FALSE(seq.tryEnqueue(extra, &rejected));
    TEST_ASSERT_TRUE(rejected == extra);
    TEST_ASSERT_EQUAL(2, (int)seq.pending());

    // Without an out-parameter the failure is still reported
    TEST_ASSERT_FALSE(seq.tryEnqueue(extra));
}

void test_enqueue_drops_when_full() {
    StaticSequencer<2> seq(pin, false);
    seq.enqueue(Pattern::fromRaw(0b1, 1));
    seq.enqueue(Pattern::fromRaw(0b0, 1));
    seq.enqueue(Pattern::fromRaw(0b1, 1));  // dropped

    TEST_ASSERT_EQUAL(2, (int)seq.pending());

    assertDrives(seq, "10");
    TEST_ASSERT_TRUE(seq.idle());
    assertDrives(seq, "0");
}

void test_current_pattern_does_not_use_a_slot() {
    StaticSequencer<1> seq(pin, false);
    seq.enqueue(Pattern::fromRaw(0b111, 3));
    seq.step();

    // The 3-step pattern is playing, its slot is free again
    TEST_ASSERT_EQUAL(0, (int)seq.pending());
    TEST_ASSERT_TRUE(seq.tryEnqueue(Pattern::fromRaw(0b0, 1)));
    TEST_ASSERT_FALSE(seq.tryEnqueue(Pattern::fromRaw(0b1, 1)));

    assertDrives(seq, "11" "0");
    TEST_ASSERT_TRUE(seq.idle());
}

void test_queue_wraps_around_storage() {
    StaticSequencer<2> seq(pin, false);

    for (int i = 0; i < 10; i++) {
        bool on = (i % 3) == 0;
        TEST_ASSERT_TRUE(seq.tryEnqueue(Pattern::fromRaw(on ? 0b1 : 0b0, 1)));
        seq.step();
        TEST_ASSERT_EQUAL(on, pin.high);
        TEST_ASSERT_TRUE(seq.idle());
    }
}

// =====================================================
// Pin Failures
// =====================================================

void test_try_step_reports_pin_error_and_advances() {
    StaticSequencer<1> seq(pin, false);
    seq.enqueue(Pattern::fromRaw(0b101, 3));
    size_t first = pin.writeCount;

    pin.failWrites = true;
    TEST_ASSERT_EQUAL(7, seq.tryStep());
    TEST_ASSERT_EQUAL(7, seq.tryStep());
    TEST_ASSERT_EQUAL(7, seq.tryStep());

    // All three steps were attempted in order even though they failed
    TEST_ASSERT_TRUE(pin.levelAt(first));
    TEST_ASSERT_FALSE(pin.levelAt(first + 1));
    TEST_ASSERT_TRUE(pin.levelAt(first + 2));
    TEST_ASSERT_TRUE(seq.idle());

    pin.failWrites = false;
    TEST_ASSERT_EQUAL(PIN_OK, seq.tryStep());
    TEST_ASSERT_FALSE(pin.high);
}

void test_step_discards_pin_errors() {
    StaticSequencer<1> seq(pin, false);
    seq.enqueue(Pattern::fromRaw(0b11, 2));

    pin.failWrites = true;
    seq.step();
    seq.step();

    TEST_ASSERT_TRUE(seq.idle());
}

void test_try_step_ok_on_success() {
    StaticSequencer<1> seq(pin, false);
    seq.enqueue(Pattern::fromRaw(0b1, 1));

    TEST_ASSERT_EQUAL(PIN_OK, seq.tryStep());
    TEST_ASSERT_TRUE(pin.high);
}

// =====================================================
// Clear
// =====================================================

void test_clear_drops_everything() {
    StaticSequencer<3> seq(pin, true);
    seq.enqueue(patterns::morse::SOS);
    seq.enqueue(patterns::morse::SOS);
    seq.step();
    TEST_ASSERT_FALSE(pin.high);  // active-low, first step on

    seq.clear();

    TEST_ASSERT_TRUE(seq.idle());
    TEST_ASSERT_EQUAL(0, (int)seq.pending());
    TEST_ASSERT_TRUE(pin.high);

    // A new pattern starts from its first step
    seq.enqueue(Pattern::fromRaw(0b10, 2));
    assertDrives(seq, "01");
}

// =====================================================
// Test Runner
// =====================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_construct_drives_inactive_level);
    RUN_TEST(test_construct_active_low_drives_high);
    RUN_TEST(test_construct_ignores_pin_failure);
    RUN_TEST(test_idle_lifecycle);
    RUN_TEST(test_single_pattern_then_inactive);
    RUN_TEST(test_step_when_idle_keeps_driving_inactive);
    RUN_TEST(test_sos);
    RUN_TEST(test_queued_patterns_play_back_to_back);
    RUN_TEST(test_queued_sos_three_times);
    RUN_TEST(test_library_pattern_unchanged_after_play);
    RUN_TEST(test_zero_length_patterns_are_skipped);
    RUN_TEST(test_only_empty_patterns_leave_sequencer_idle);
    RUN_TEST(test_full_width_pattern_plays_all_steps);
    RUN_TEST(test_active_low_inverts_every_step);
    RUN_TEST(test_try_enqueue_returns_rejected_pattern);
    RUN_TEST(test_enqueue_drops_when_full);
    RUN_TEST(test_current_pattern_does_not_use_a_slot);
    RUN_TEST(test_queue_wraps_around_storage);
    RUN_TEST(test_try_step_reports_pin_error_and_advances);
    RUN_TEST(test_step_discards_pin_errors);
    RUN_TEST(test_try_step_ok_on_success);
    RUN_TEST(test_clear_drops_everything);

    return UNITY_END();
}
