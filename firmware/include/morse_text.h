#pragma once
#include <stddef.h>

#include "pattern.h"
#include "sequencer.h"

// =====================================================
// Morse Text Encoder
// =====================================================
// Turns text into patterns from patterns::morse and feeds
// them to a Sequencer, one pattern per character.
// =====================================================

// Four off steps between words
constexpr Pattern MORSE_WORD_GAP = Pattern::make<0b0000, 4>();

// Pattern for a letter, digit or supported punctuation mark
// (case-insensitive). Returns nullptr for anything else.
const Pattern* morseForChar(char c);

// Queue text on seq. Spaces become MORSE_WORD_GAP and
// unsupported characters are skipped. Stops at the first
// pattern the queue rejects.
// skipped: if given, receives how many of the consumed
// characters had no pattern
// Returns: number of characters consumed; resume from
// text + result once the sequencer has drained.
size_t enqueueMorseText(Sequencer& seq, const char* text, size_t* skipped = nullptr);
