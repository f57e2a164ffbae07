//============================================================================
//
//  SampledEdgeSource - Edge detection on a stream of logic levels
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#include "SampledEdgeSource.h"

#include <tgmath.h>

//----------------------------------------------------------------------------

void SampledEdgeSource::Configure(const DecoderOptions& options)
{
    m_invert = options.invert;

    double sample_rate = GetSampleRate();
    if (sample_rate <= 0)
        return; // clip is meaningless without a time base

    m_start_pos = options.start > 0 ? (int64_t) floor(options.start*sample_rate + 0.5) : 0;
    m_end_pos = options.end >= 0 ? (int64_t) floor(options.end*sample_rate + 0.5) : -1;
}

//----------------------------------------------------------------------------

bool SampledEdgeSource::WaitEdge(int mask, Edge *edge)
{
    while (!m_eof)
    {
        if (m_buf_idx == m_buf_cnt)
        {
            int n = ReadLevels(m_buf, LEVEL_BUFSIZE);
            if (n <= 0)
            {
                m_error = n < 0;
                m_eof = true;
                break;
            }
            m_buf_cnt = n;
            m_buf_idx = 0;
        }

        int64_t pos = m_pos++;
        int level = m_buf[m_buf_idx++] ^ (m_invert ? 1 : 0);

        if (m_end_pos >= 0 && pos >= m_end_pos)
        {
            m_eof = true;
            break;
        }

        int prev = m_level;
        m_level = level;

        // Levels before the clip start are tracked, but edges are not reported
        if (prev < 0 || prev == level || pos < m_start_pos)
            continue;

        bool rising = level > prev;
        if (mask & (rising ? EDGE_RISING : EDGE_FALLING))
        {
            edge->pos = pos;
            edge->rising = rising;
            return true;
        }
    }
    return false;
}
