//----------------------------------------------------------------------------
//
//  SoundSource - Interface for reading a recorded waveform
//
//  * Offline captures only, there is no live input
//  * Samples are delivered as float
//  * API is counted in samples, not tuples. Multichannel data is
//    interleaved, so a read of one frame of a stereo file is two samples.
//
//  Copyright (c) 2005-2024 Erik Persson
//
//----------------------------------------------------------------------------

#ifndef SOUNDSOURCE_H
#define SOUNDSOURCE_H

#include <stdint.h>

class SoundSource
{
public:
    virtual ~SoundSource() {}

    // Return sample rate in Hz
    virtual int GetSampleRate() const = 0;

    // Return no. of channels. 1=mono, 2=stereo etc
    virtual int GetChannelCnt() const = 0;

    // Return total length, counted in samples
    virtual int64_t GetLength() const = 0;

    // Return length read so far
    virtual int64_t GetReadPos() const = 0;

    // Read from current position, scaled to the +-1 range.
    // Return false on I/O error or when attempting to read past the end.
    virtual bool Read(float *buf, int cnt) = 0;

    // Release resources
    virtual void Close() = 0;
};

#endif // SOUNDSOURCE_H
