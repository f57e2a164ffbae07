//----------------------------------------------------------------------------
//
//  WaveEdgeSource - Edges from an analog waveform capture
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#include "WaveEdgeSource.h"

#include <soundio/SoundSource.h>

//----------------------------------------------------------------------------

WaveEdgeSource::WaveEdgeSource(SoundSource *src, const DecoderOptions& options) :
    m_src(src)
{
    m_channel = options.channel;
    m_channel_cnt = src->GetChannelCnt();
    m_sample_rate = options.sample_rate > 0 ? options.sample_rate : src->GetSampleRate();

    double half_width = 0.5*(options.hysteresis > 0 ? options.hysteresis : 0);
    m_high_threshold = options.threshold + half_width;
    m_low_threshold = options.threshold - half_width;

    Configure(options);
}

//----------------------------------------------------------------------------

bool WaveEdgeSource::IsOk() const
{
    return m_channel >= 0 && m_channel < m_channel_cnt;
}

//----------------------------------------------------------------------------

int WaveEdgeSource::ReadLevels(uint8_t *buf, int cnt)
{
    if (!IsOk())
        return -1;

    int64_t frames_left = (m_src->GetLength() - m_src->GetReadPos())/m_channel_cnt;
    if (frames_left < cnt)
        cnt = (int) frames_left;
    if (cnt <= 0)
        return 0;

    m_frames.resize(((size_t) cnt)*m_channel_cnt);
    if (!m_src->Read(&m_frames[0], cnt*m_channel_cnt))
        return -1;

    for (int i=0; i<cnt; i++)
    {
        float x = m_frames[((size_t) i)*m_channel_cnt + m_channel];

        // First sample is compared against the center of the window
        if (m_state < 0)
            m_state = x > 0.5f*(m_high_threshold + m_low_threshold) ? 1 : 0;
        else if (x > m_high_threshold)
            m_state = 1;
        else if (x < m_low_threshold)
            m_state = 0;

        buf[i] = (uint8_t) m_state;
    }
    return cnt;
}
