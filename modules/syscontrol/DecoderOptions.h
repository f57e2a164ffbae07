//============================================================================
//
//  Decoder settings struct
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#ifndef DECODEROPTIONS_H
#define DECODEROPTIONS_H

// Nominal protocol timing, microseconds
#define SC_RESET_MIN_US (4000) // A high phase longer than this is a reset
#define SC_ZERO_MIN_US  (3000) // Falling-to-falling interval for bit 0 ...
#define SC_ZERO_MAX_US  (5000) // ... exclusive bounds
#define SC_ONE_MIN_US   (6000) // Falling-to-falling interval for bit 1 ...
#define SC_ONE_MAX_US   (8000) // ... exclusive bounds

struct DecoderOptions
{
    // Input
    const char *filename = 0;    // Input file name
    double start = -1;           // Start time in seconds, -1 if unspecified
    double end = -1;             // End time in seconds, -1 if unspecified
    double sample_rate = 0;      // Hz, overrides file header when nonzero
    bool raw = false;            // Input is a raw logic dump, one byte per sample
    int bit = 0;                 // Bit carrying the data line in raw dump
    int channel = 0;             // Channel carrying the data line in sound file
    double threshold = 0;        // Schmitt trigger center, full scale is +-1
    double hysteresis = 0.1;     // Schmitt trigger total width
    bool invert = false;         // Swap logic levels, e.g. after a transistor stage

    bool verbose = false;        // Verbose log mode

    // Timing windows
    double reset_min_us = SC_RESET_MIN_US;
    double zero_min_us  = SC_ZERO_MIN_US;
    double zero_max_us  = SC_ZERO_MAX_US;
    double one_min_us   = SC_ONE_MIN_US;
    double one_max_us   = SC_ONE_MAX_US;
};

#endif
