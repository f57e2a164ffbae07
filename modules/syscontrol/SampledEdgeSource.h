//============================================================================
//
//  SampledEdgeSource - Edge detection on a stream of logic levels
//
//  Base class for edge sources reading sampled captures. Subclasses
//  deliver one logic level per sample, this class finds the transitions.
//
//  * An edge is reported at sample n when level(n) != level(n-1)
//  * The level before the first sample is taken to equal the first sample,
//    so there is never an edge at the first sample
//  * Positions are absolute even when a clip interval is set
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#ifndef SAMPLEDEDGESOURCE_H
#define SAMPLEDEDGESOURCE_H

#include "EdgeSource.h"
#include "DecoderOptions.h"

#include <stddef.h>
#include <stdint.h>

#define LEVEL_BUFSIZE (4096)

class SampledEdgeSource : public EdgeSource
{
    uint8_t m_buf[LEVEL_BUFSIZE];
    int m_buf_cnt = 0;
    int m_buf_idx = 0;

    int64_t m_pos = 0;         // position of next sample in m_buf
    int m_level = -1;          // level of previous sample, -1 before first
    bool m_eof = false;
    bool m_error = false;

    // Clip interval
    int64_t m_start_pos = 0;
    int64_t m_end_pos = -1;    // -1 when open ended
    bool m_invert = false;

protected:
    // Fill buf with up to cnt levels (0 or 1) continuing from the previous
    // call. Return no. of levels produced, 0 at end of data, -1 on error.
    virtual int ReadLevels(uint8_t *buf, int cnt) = 0;

public:
    // Apply clip interval and inversion from options.
    // Call when the sample rate is known, i.e. after opening the input.
    void Configure(const DecoderOptions& options);

    // Set when reading stopped because of an I/O error rather than
    // the end of the data
    bool HasError() const { return m_error; }

    // Position of the next sample to be examined
    int64_t GetPos() const { return m_pos; }

    // EdgeSource interface
    bool WaitEdge(int mask, Edge *edge) override;
};

#endif
