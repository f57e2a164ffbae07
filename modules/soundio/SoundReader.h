//============================================================================
//
//  SoundReader - Audio file reader
//
//  * Reads captures stored as WAV, AIFF, FLAC etc using libsndfile
//  * Provides the SoundSource interface
//  * Non-copyable
//  * Block cache for efficient random access
//  * API is counted in samples, not tuples.
//
//  Copyright (c) 2005-2024 Erik Persson
//
//============================================================================

#ifndef SOUNDREADER_H
#define SOUNDREADER_H

#include <stdint.h>
#include "SoundSource.h"

class SoundReaderBackend;

class SoundReader : public SoundSource
{
protected:
    SoundReaderBackend *m_backend = 0;

    // Block buffer
    int m_block_size = 0;   // size of block
    int64_t m_block_cnt = 0;// no. of blocks in file
    int64_t m_block_no = -1;// no. of current loaded block or -1
    short *m_block_buf = 0; // storage

    // Outwards-facing read position
    int64_t m_read_pos = 0;

public:
    SoundReader() {}
    SoundReader(const SoundReader& other) = delete;
    SoundReader& operator=(const SoundReader& other) = delete;
    virtual ~SoundReader();

    // Open file. Only the header is read here, data reads are deferred.
    // If silent flag is set, do not print error message,
    // this is useful when probing whether a file is a sound file at all.
    bool Open(const char *path, bool silent = false);

    // Return true after successful Open
    bool IsOpen() const { return m_backend != 0; }

    // SoundSource interface
    // Methods are documented in SoundSource.h
    int GetSampleRate() const override;
    int GetChannelCnt() const override;
    int64_t GetLength() const override;
    int64_t GetReadPos() const override;
    bool Read(float *buf, int cnt) override;
    void Close() override;

protected:
    short *GetBlock(int64_t block_no);
    void ReleaseBlocks();
};

#endif // SOUNDREADER_H
