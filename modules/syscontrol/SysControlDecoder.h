//============================================================================
//
//  SysControlDecoder - decoder for the SYSTEM CONTROL protocol
//
//  SYSTEM CONTROL is the single wire bus between a Kenwood VH series
//  amplifier and its tape deck, minidisc and CD player.
//
//  * The line is high for about 5 ms to mark the start of a word (reset)
//  * Then 16 data bits follow, most significant bit first
//  * Return-to-zero: the bit value is given by the length of the low phase,
//    2 ms for 0 and 5 ms for 1, each followed by 2 ms high
//  * Only the time between consecutive falling edges is looked at,
//    nominally 4 ms for 0 and 7 ms for 1
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#ifndef SYSCONTROLDECODER_H
#define SYSCONTROLDECODER_H

#include "Annotation.h"
#include "DecoderOptions.h"
#include "EdgeSource.h"

#include <stdint.h>

#define SC_WORD_BITS (16)

enum class DecodeStatus
{
    Ok,                 // Source exhausted
    MissingSampleRate,  // Nothing decoded, sample period unknown
};

enum class DecoderState
{
    FindReset,          // Waiting for a long high phase
    ReadingBits,        // Collecting the bits of a word
};

//----------------------------------------------------------------------------

class SysControlDecoder
{
    DecoderOptions m_options;
    AnnotationSink *m_sink;       // borrowed

    double m_sample_usec = 0;     // Length of one sample, 0 if unknown

    DecoderState m_state;
    int64_t m_last_rising;        // Last rising edge seen, -1 before any
    int64_t m_last_falling;       // Last falling edge seen, -1 before any
    int64_t m_command_start;      // Rising edge starting the reset pulse
    int64_t m_word_start;         // Falling edge ending the reset pulse
    uint16_t m_content;           // Bits collected so far, latest is LSB
    int m_bit_cnt;                // No. of bits in m_content

public:
    SysControlDecoder(const DecoderOptions& options, AnnotationSink *sink);
    SysControlDecoder(const SysControlDecoder&) = delete;
    SysControlDecoder& operator=(const SysControlDecoder&) = delete;

    // Sample rate in Hz, must be set before decoding. Pass 0 to clear.
    void SetSampleRate(double sample_rate);
    bool HasSampleRate() const { return m_sample_usec > 0; }

    // Return to initial state to start a new session. Sample rate is kept.
    void Reset();

    // Main entry point - decode until the source is exhausted.
    // A sample rate reported by the source replaces any set before.
    DecodeStatus Decode(EdgeSource *src);

    // Process a single edge. Edges must come in increasing position order.
    // Edges not in GetWantedEdges() are ignored.
    DecodeStatus PutEdge(const Edge& edge);

    // Edge polarities the current state waits for
    int GetWantedEdges() const;

    DecoderState GetState() const { return m_state; }
    int GetBitCount() const { return m_bit_cnt; }
    uint16_t GetContent() const { return m_content; }
    int64_t GetLastRising() const { return m_last_rising; }
    int64_t GetLastFalling() const { return m_last_falling; }

    // When verbosity is on, print message with time coordinate
    void VerboseLog(int64_t pos, const char *fmt, ...);

private:
    void FindReset(const Edge& edge);
    void ReadBit(const Edge& edge);
    void Put(int64_t start, int64_t end, int level, const char *text);
};

#endif
