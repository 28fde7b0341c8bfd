#include "sequencer.h"

Sequencer::Sequencer(IOutputPin& pin, Pattern* slots, size_t capacity, bool activeLow)
    : _pin(pin)
    , _queue(slots, capacity)
    , _current()
    , _hasCurrent(false)
    , _cursor(0)
    , _activeLow(activeLow)
{
    // Start dark; nothing to report to yet
    (void)drive(false);
}

void Sequencer::enqueue(const Pattern& pattern) {
    (void)tryEnqueue(pattern);
}

bool Sequencer::tryEnqueue(const Pattern& pattern, Pattern* rejected) {
    if (_queue.push(pattern)) {
        return true;
    }
    if (rejected) {
        *rejected = pattern;
    }
    return false;
}

void Sequencer::step() {
    (void)tryStep();
}

PinStatus Sequencer::tryStep() {
    if (!_hasCurrent) {
        _hasCurrent = loadNext();
    }

    bool active = false;
    if (_hasCurrent) {
        active = _current.step();
        _cursor++;

        // Pattern exhausted, pick up the next one on the following call
        if (_cursor >= _current.used()) {
            _cursor = 0;
            _hasCurrent = false;
        }
    }

    // Pin write goes last so a failure cannot leave the sequence stuck
    return drive(active);
}

void Sequencer::clear() {
    _queue.clear();
    _hasCurrent = false;
    _cursor = 0;
    (void)drive(false);
}

bool Sequencer::loadNext() {
    Pattern next;
    while (_queue.pop(next)) {
        // Empty patterns have no steps to play
        if (!next.empty()) {
            _current = next;
            _cursor = 0;
            return true;
        }
    }
    return false;
}

PinStatus Sequencer::drive(bool active) {
    if (active != _activeLow) {
        return _pin.setHigh();
    }
    return _pin.setLow();
}
