//----------------------------------------------------------------------------
//
//  LogicEdgeSource - Edges from a raw logic analyzer dump
//
//  The dump holds one byte per sample with one channel per bit, as written
//  by logic analyzer software for captures of up to eight channels.
//  There is no header, so the sample rate has to be given by the user.
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#ifndef LOGICEDGESOURCE_H
#define LOGICEDGESOURCE_H

#include "SampledEdgeSource.h"
#include "DecoderOptions.h"

#include <stdio.h>

class LogicEdgeSource : public SampledEdgeSource
{
    DecoderOptions m_options;
    FILE *m_file = 0;

public:
    LogicEdgeSource(const DecoderOptions& options);
    LogicEdgeSource(const LogicEdgeSource&) = delete;
    LogicEdgeSource& operator=(const LogicEdgeSource&) = delete;
    ~LogicEdgeSource();

    // Open options.filename, return false with a message on failure
    bool Open();

    // Sample rate from options, 0 when not given
    double GetSampleRate() const override { return m_options.sample_rate; }

protected:
    int ReadLevels(uint8_t *buf, int cnt) override;
};

#endif
