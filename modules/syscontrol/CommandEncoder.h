//----------------------------------------------------------------------------
//
//  CommandEncoder - waveform synthesis for the SYSTEM CONTROL protocol
//
//  Produces the signal an amplifier would put on the bus, as a square
//  wave at +-60% of full scale. Useful for testing decoders.
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#ifndef COMMANDENCODER_H
#define COMMANDENCODER_H

#include <stdint.h>
#include <vector>

class SoundSink;

#define ENCODER_BUFSIZE (1024)
#define ENCODER_RATE    (44100)

// Nominal phase lengths in seconds
#define ENC_RESET_TIME (5e-3)  // High, start of word
#define ENC_ZERO_TIME  (2e-3)  // Low, bit value 0
#define ENC_ONE_TIME   (5e-3)  // Low, bit value 1
#define ENC_HIGH_TIME  (2e-3)  // High, after each bit
#define ENC_GAP_TIME   (20e-3) // Low, between words

class CommandEncoder
{
    float m_buf[ENCODER_BUFSIZE];
    int m_buf_cnt = 0;
    SoundSink *m_sink = 0;
    bool m_own_sink = false;
    bool m_open = false;
    bool m_ok = true;

    int m_sample_rate = 0;
    double m_time = 0;     // Time of waveform put so far, seconds
    int64_t m_pos = 0;     // Samples emitted so far
    std::vector<int64_t> m_command_starts;

public:
    CommandEncoder() {}
    CommandEncoder(const CommandEncoder&) = delete;
    CommandEncoder& operator=(const CommandEncoder&) = delete;
    ~CommandEncoder();

    // Open output .wav file
    bool Open(const char *filename, int sample_rate = ENCODER_RATE);

    // Write to a sink owned by the caller
    bool Open(SoundSink *sink);

    // Append one word, preceded by an idle gap and a reset pulse
    void PutWord(uint16_t word);

    // Append idle gap, flush output and close file
    // Return true if everything was written without errors
    bool Close();

    // Sample numbers where the reset pulse of each word starts, that is
    // the start of the command annotation a decoder should produce
    const std::vector<int64_t>& GetCommandStarts() const { return m_command_starts; }

    // Length in seconds put so far
    double GetDuration() const { return m_time; }

protected:
    void EmitFlush();
    void EmitSample(float y);
    void Hold(bool level, double duration);
};

#endif
