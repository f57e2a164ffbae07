//============================================================================
//
//  CommandEncoder - waveform synthesis for the SYSTEM CONTROL protocol
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#include "CommandEncoder.h"
#include <soundio/SoundWriter.h>
#include <tgmath.h>
#include <assert.h>

//----------------------------------------------------------------------------

CommandEncoder::~CommandEncoder()
{
    (void) Close();
}

//----------------------------------------------------------------------------

// Write out buffered samples
void CommandEncoder::EmitFlush()
{
    if (m_buf_cnt && m_open && m_ok)
        m_ok = m_sink->Write(m_buf, m_buf_cnt);
    m_buf_cnt = 0;
}

//----------------------------------------------------------------------------

void CommandEncoder::EmitSample(float y)
{
    assert(m_buf_cnt < ENCODER_BUFSIZE);
    m_buf[m_buf_cnt++] = y;
    if (m_buf_cnt == ENCODER_BUFSIZE)
        EmitFlush();
}

//----------------------------------------------------------------------------

// Hold line at level for duration.
// Phase boundaries are rounded to the nearest sample from the exact
// time, so rounding errors do not accumulate.
void CommandEncoder::Hold(bool level, double duration)
{
    m_time += duration;
    int64_t end_pos = (int64_t) floor(m_time*m_sample_rate + 0.5);

    // We use 60% of the available amplitude range
    float y = level ? 0.6f : -0.6f;
    while (m_pos < end_pos)
    {
        EmitSample(y);
        m_pos++;
    }
}

//----------------------------------------------------------------------------

bool CommandEncoder::Open(const char *filename, int sample_rate)
{
    (void) Close();

    SoundWriter *writer = new SoundWriter;
    if (!writer->Open(filename, sample_rate))
    {
        delete writer;
        return false;
    }
    m_sink = writer;
    m_own_sink = true;
    return Open(m_sink);
}

//----------------------------------------------------------------------------

bool CommandEncoder::Open(SoundSink *sink)
{
    if (m_sink != sink)
    {
        (void) Close();
        m_sink = sink;
        m_own_sink = false;
    }

    m_sample_rate = sink->GetSampleRate();
    m_ok = m_open = m_sample_rate > 0;
    m_time = 0;
    m_pos = 0;
    m_buf_cnt = 0;
    m_command_starts.clear();
    return m_ok;
}

//----------------------------------------------------------------------------

void CommandEncoder::PutWord(uint16_t word)
{
    if (!m_open)
        return;

    Hold(false, ENC_GAP_TIME);
    m_command_starts.push_back(m_pos);
    Hold(true, ENC_RESET_TIME);

    // Each bit: low phase of varying length, then fixed high phase
    for (int i=15; i>=0; i--)
    {
        bool bit = (word>>i)&1;
        Hold(false, bit ? ENC_ONE_TIME : ENC_ZERO_TIME);
        Hold(true, ENC_HIGH_TIME);
    }
}

//----------------------------------------------------------------------------

// Return true if file was written without errors
bool CommandEncoder::Close()
{
    bool ok = m_ok;
    if (m_open)
    {
        Hold(false, ENC_GAP_TIME);
        EmitFlush();
        ok = m_ok;
        m_open = false;
    }

    if (m_sink && m_own_sink)
    {
        if (!m_sink->Close())
            ok = false;
        delete m_sink;
    }
    m_sink = 0;
    m_own_sink = false;
    m_ok = ok;
    return ok;
}
