//----------------------------------------------------------------------------
//
//  WaveEdgeSource - Edges from an analog waveform capture
//
//  One channel of a sound file is binarized using a Schmitt trigger.
//  Positions are counted in frames of the sound file.
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#ifndef WAVEEDGESOURCE_H
#define WAVEEDGESOURCE_H

#include "SampledEdgeSource.h"
#include "DecoderOptions.h"

#include <vector>

class SoundSource;

class WaveEdgeSource : public SampledEdgeSource
{
    SoundSource *m_src;        // borrowed
    int m_channel;
    int m_channel_cnt;
    double m_sample_rate;
    float m_high_threshold;    // switch to high above this
    float m_low_threshold;     // switch to low below this
    int m_state = -1;          // current trigger output, -1 before first sample
    std::vector<float> m_frames;

public:
    WaveEdgeSource(SoundSource *src, const DecoderOptions& options);

    // Return false if the selected channel does not exist
    bool IsOk() const;

    double GetSampleRate() const override { return m_sample_rate; }

protected:
    int ReadLevels(uint8_t *buf, int cnt) override;
};

#endif
