#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#include "pattern.h"

// =====================================================
// Pattern Queue
// =====================================================
// Fixed-capacity FIFO of Patterns stored in a ring over
// caller-provided slots. Never allocates; a push into a
// full queue fails and leaves the queue untouched.
// =====================================================

class PatternQueue {
public:
    PatternQueue(Pattern* slots, size_t capacity);

    // Append to the tail. Returns false if the queue is full.
    bool push(const Pattern& pattern);

    // Remove the head into out. Returns false if the queue is empty.
    bool pop(Pattern& out);

    void clear();

    size_t size() const { return _count; }
    size_t capacity() const { return _capacity; }
    bool empty() const { return _count == 0; }
    bool full() const { return _count >= _capacity; }

private:
    Pattern* _slots;
    size_t _capacity;
    size_t _head;
    size_t _count;
};
