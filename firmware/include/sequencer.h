#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#include "pattern.h"
#include "pattern_queue.h"
#include "i_output_pin.h"

// =====================================================
// Pattern Sequencer
// =====================================================
// Drives one output pin through queued Patterns, one step
// per call to step(). There is no notion of time here: call
// step() at whatever rate one step should last. To play
// 0b101010 as a 1 Hz blink, step every 500 ms; to play
// 0b11110000 as a 1 Hz blink, step every 125 ms.
//
// Usage:
//   StaticSequencer<8> seq(pin, true);   // 8 slots, active-low
//   seq.enqueue(patterns::morse::SOS);
//   while (true) { seq.step(); platform_delay_ms(250); }
//
// Once the queue runs dry the pin is held at its inactive
// level. Pin errors never stop the sequence from advancing;
// they are only reported by tryStep().
// =====================================================

class Sequencer {
public:
    // Storage for the queue is owned by the caller (see
    // StaticSequencer). The pin is driven inactive right away.
    Sequencer(IOutputPin& pin, Pattern* slots, size_t capacity, bool activeLow);

    Sequencer(const Sequencer&) = delete;
    Sequencer& operator=(const Sequencer&) = delete;

    // Queue a pattern; silently dropped if the queue is full
    void enqueue(const Pattern& pattern);

    // Queue a pattern. Returns false if the queue is full, and
    // hands the pattern back through rejected when given.
    bool tryEnqueue(const Pattern& pattern, Pattern* rejected = nullptr);

    // Advance one step and drive the pin. Pin errors are discarded.
    void step();

    // Advance one step and drive the pin, returning the pin's
    // status. The sequence has already moved on when this
    // returns an error.
    PinStatus tryStep();

    // Drop the current pattern and everything queued, then
    // drive the pin inactive
    void clear();

    // No pattern playing and nothing queued
    bool idle() const { return !_hasCurrent && _queue.empty(); }

    size_t pending() const { return _queue.size(); }
    size_t capacity() const { return _queue.capacity(); }
    bool activeLow() const { return _activeLow; }

private:
    bool loadNext();
    PinStatus drive(bool active);

    IOutputPin& _pin;
    PatternQueue _queue;
    Pattern _current;
    bool _hasCurrent;
    uint8_t _cursor;
    bool _activeLow;
};

// Sequencer with room for Capacity queued patterns. The
// pattern currently playing does not take a slot.
template <size_t Capacity>
class StaticSequencer : public Sequencer {
    static_assert(Capacity > 0, "StaticSequencer needs at least one slot");

public:
    StaticSequencer(IOutputPin& pin, bool activeLow)
        : Sequencer(pin, _slots, Capacity, activeLow) {}

private:
    Pattern _slots[Capacity];
};
