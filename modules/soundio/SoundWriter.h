//============================================================================
//
//  SoundWriter - Audio waveform file writer
//
//  * Provides the SoundSink interface
//  * Uses libsndfile internally
//  * Writes 16-bit mono .wav, which is what the bus decoders expect
//    of a test signal
//
//  Copyright (c) 2005-2024 Erik Persson
//
//============================================================================

#ifndef SOUNDWRITER_H
#define SOUNDWRITER_H

#include "SoundSink.h"
#include <stdint.h>

class SoundWriterBackend;

class SoundWriter : public SoundSink
{
protected:
    SoundWriterBackend *m_backend = 0;

public:
    SoundWriter() {}
    SoundWriter(const SoundWriter& other) = delete;
    SoundWriter& operator=(const SoundWriter& other) = delete;
    virtual ~SoundWriter();

    // Create file, replacing any existing one. Call before using the
    // SoundSink interface below. Return true on success.
    bool Open(const char *path, int sample_rate);

    // SoundSink interface
    // Methods are documented in SoundSink.h
    int GetSampleRate() const override;
    int64_t GetWritePos() const override;
    bool Write(const short *buf, int len) override;
    bool Write(const float *buf, int len) override;
    bool Close() override;
};

#endif // SOUNDWRITER_H
