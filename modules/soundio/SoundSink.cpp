//============================================================================
//
//  SoundSink implementation
//
//  Copyright (c) 2005-2024 Erik Persson
//
//============================================================================

#include "SoundSink.h"

//----------------------------------------------------------------------------

// Float write in terms of the 16-bit write.
// Expected input range is +-1. Converted in chunks to bound stack usage.
bool SoundSink::Write(const float *buf, int len)
{
    const int N = 1024;
    short shortbuf[N];
    while (len > 0)
    {
        int n = len < N ? len : N;
        for (int i= 0; i<n; i++)
        {
            // Multiply by 32768 and clip to 16-bit range -32768..32767
            double val = 32768*buf[i];
            if (val >= 32767)
                shortbuf[i] = 32767;
            else if (val < -32768)
                shortbuf[i] = -32768;
            else
                shortbuf[i] = (short) val;
        }
        if (!Write(shortbuf, n))
            return false;
        buf += n;
        len -= n;
    }
    return true;
}
