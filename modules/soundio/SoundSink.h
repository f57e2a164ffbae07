//----------------------------------------------------------------------------
//
//  SoundSink - Interface for waveform output
//
//  * Supports float
//  * Supports 16-bit integer
//  * Only supports mono
//
//  Copyright (c) 2005-2024 Erik Persson
//
//----------------------------------------------------------------------------

#ifndef SOUNDSINK_H
#define SOUNDSINK_H

#include <stdint.h>

class SoundSink
{
public:
    virtual ~SoundSink() {}

    // Return sample rate in Hz
    virtual int GetSampleRate() const = 0;

    // Return length written so far
    virtual int64_t GetWritePos() const = 0;

    // Blocking write function - short version
    // Return true if successful
    virtual bool Write(const short *buf, int len) = 0;

    // Blocking write function - float version
    // Return true if successful
    virtual bool Write(const float *buf, int len);

    // Finish writing and release resources
    // Return true if everything written so far has been stored
    virtual bool Close() = 0;
};

#endif // SOUNDSINK_H
