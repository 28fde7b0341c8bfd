#include "pattern_queue.h"

PatternQueue::PatternQueue(Pattern* slots, size_t capacity)
    : _slots(slots)
    , _capacity(slots ? capacity : 0)
    , _head(0)
    , _count(0)
{
}

bool PatternQueue::push(const Pattern& pattern) {
    if (full()) {
        return false;
    }

    size_t tail = (_head + _count) % _capacity;
    _slots[tail] = pattern;
    _count++;
    return true;
}

bool PatternQueue::pop(Pattern& out) {
    if (empty()) {
        return false;
    }

    out = _slots[_head];
    _head = (_head + 1) % _capacity;
    _count--;
    return true;
}

void PatternQueue::clear() {
    _head = 0;
    _count = 0;
}
