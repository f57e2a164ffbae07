//============================================================================
//
//  SysControlDecoder - decoder for the SYSTEM CONTROL protocol
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#include "SysControlDecoder.h"
#include "AnnotationPrinter.h"
#include "CommandTable.h"

#include <assert.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

//----------------------------------------------------------------------------

SysControlDecoder::SysControlDecoder(const DecoderOptions& options, AnnotationSink *sink) :
    m_options(options),
    m_sink(sink)
{
    assert(sink);
    if (options.sample_rate > 0)
        SetSampleRate(options.sample_rate);
    Reset();
}

//----------------------------------------------------------------------------

void SysControlDecoder::SetSampleRate(double sample_rate)
{
    m_sample_usec = sample_rate > 0 ? 1e6/sample_rate : 0;
}

//----------------------------------------------------------------------------

void SysControlDecoder::Reset()
{
    m_state = DecoderState::FindReset;
    m_last_rising = -1;
    m_last_falling = -1;
    m_command_start = -1;
    m_word_start = -1;
    m_content = 0;
    m_bit_cnt = 0;
}

//----------------------------------------------------------------------------

void SysControlDecoder::VerboseLog(int64_t pos, const char *fmt, ...)
{
    if (!m_options.verbose)
        return;

    print_time(stdout, pos*m_sample_usec*1e-6);
    printf("  ");

    va_list ap;
    va_start(ap, fmt);
    (void) vprintf(fmt, ap);
    va_end(ap);
}

//----------------------------------------------------------------------------

int SysControlDecoder::GetWantedEdges() const
{
    switch (m_state)
    {
    case DecoderState::FindReset:
        return EDGE_ANY;
    case DecoderState::ReadingBits:
        return EDGE_FALLING;
    }
    return EDGE_ANY;
}

//----------------------------------------------------------------------------

void SysControlDecoder::Put(int64_t start, int64_t end, int level, const char *text)
{
    Annotation ann;
    ann.start = start;
    ann.end = end;
    ann.level = level;
    snprintf(ann.text, sizeof(ann.text), "%s", text);
    m_sink->Put(ann);
}

//----------------------------------------------------------------------------

// Look for a high phase that is long enough to be a reset
void SysControlDecoder::FindReset(const Edge& edge)
{
    if (edge.rising)
    {
        m_last_rising = edge.pos;
        return;
    }

    m_last_falling = edge.pos;

    // No rising edge yet, so the length of the high phase is unknown
    if (m_last_rising < 0)
        return;

    double time_high = (edge.pos - m_last_rising)*m_sample_usec;
    if (time_high > m_options.reset_min_us)
    {
        Put(m_last_rising, edge.pos, ANN_BIT, "RESET");
        m_command_start = m_last_rising;
        m_word_start = edge.pos;
        m_content = 0;
        m_bit_cnt = 0;
        m_state = DecoderState::ReadingBits;
        VerboseLog(m_last_rising, "Reset, %.0f us high\n", time_high);
    }
}

//----------------------------------------------------------------------------

// Classify the time since the previous falling edge as a bit value
void SysControlDecoder::ReadBit(const Edge& edge)
{
    if (edge.rising)
        return; // only falling edges carry timing

    double time_low = (edge.pos - m_last_falling)*m_sample_usec;

    int bit = -1;
    if (time_low > m_options.zero_min_us && time_low < m_options.zero_max_us)
        bit = 0;
    else if (time_low > m_options.one_min_us && time_low < m_options.one_max_us)
        bit = 1;

    if (bit >= 0)
    {
        m_content = (uint16_t) ((m_content << 1) | bit);
        m_bit_cnt++;
        Put(m_last_falling, edge.pos, ANN_BIT, bit ? "1" : "0");
    }
    else
    {
        VerboseLog(m_last_falling, "Ignored interval of %.0f us after bit %d\n",
                   time_low, m_bit_cnt);
    }
    m_last_falling = edge.pos;

    if (m_bit_cnt == SC_WORD_BITS)
    {
        char hex[8];
        snprintf(hex, sizeof(hex), "0x%04x", (unsigned) m_content);
        Put(m_word_start, m_last_falling, ANN_WORD, hex);
        Put(m_command_start, m_last_falling, ANN_COMMAND, lookup_command(m_content));
        m_state = DecoderState::FindReset;
    }
}

//----------------------------------------------------------------------------

DecodeStatus SysControlDecoder::PutEdge(const Edge& edge)
{
    if (!HasSampleRate())
        return DecodeStatus::MissingSampleRate;

    switch (m_state)
    {
    case DecoderState::FindReset:
        FindReset(edge);
        break;
    case DecoderState::ReadingBits:
        ReadBit(edge);
        break;
    }
    return DecodeStatus::Ok;
}

//----------------------------------------------------------------------------

DecodeStatus SysControlDecoder::Decode(EdgeSource *src)
{
    if (src->GetSampleRate() > 0)
        SetSampleRate(src->GetSampleRate());

    if (!HasSampleRate())
        return DecodeStatus::MissingSampleRate;

    // Runs until the source is exhausted, possibly in the middle of a word
    Edge edge;
    while (src->WaitEdge(GetWantedEdges(), &edge))
    {
        DecodeStatus status = PutEdge(edge);
        if (status != DecodeStatus::Ok)
            return status;
    }

    if (m_state == DecoderState::ReadingBits)
        VerboseLog(m_last_falling, "End of data after %d bits\n", m_bit_cnt);
    return DecodeStatus::Ok;
}
