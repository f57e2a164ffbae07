//============================================================================
//
//  EdgeSource - Interface to providers of logic level edges
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#ifndef EDGESOURCE_H
#define EDGESOURCE_H

#include <stdint.h>

// Edge polarity masks for WaitEdge
#define EDGE_RISING  (1)
#define EDGE_FALLING (2)
#define EDGE_ANY     (EDGE_RISING|EDGE_FALLING)

struct Edge
{
    int64_t pos;  // Sample number of the first sample at the new level
    bool rising;  // Set for low-to-high, clear for high-to-low
};

//----------------------------------------------------------------------------

class EdgeSource
{
public:
    virtual ~EdgeSource() {}

    // Sample rate in Hz, or 0 when not known
    virtual double GetSampleRate() const = 0;

    // Block until the next edge whose polarity is in 'mask'.
    // Edges of other polarity are consumed silently.
    // Positions are strictly increasing between calls.
    // Return false at end of stream.
    virtual bool WaitEdge(int mask, Edge *edge) = 0;
};

#endif
