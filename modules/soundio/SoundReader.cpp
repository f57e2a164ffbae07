//----------------------------------------------------------------------------
//
// SoundReader implementation
//
// Copyright (c) 2005-2024 Erik Persson
//
//----------------------------------------------------------------------------

#include "SoundReader.h"
#include <sys/stat.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <assert.h>
#include <sndfile.h>

//----------------------------------------------------------------------------
// SoundReaderBackend - wav, aiff, flac etc using libsndfile
//----------------------------------------------------------------------------

class SoundReaderBackend
{
    SF_INFO m_info;
    SNDFILE *m_sf = 0;
    int64_t m_filepos = 0; // in samples, multiple of channel count

public:
    SoundReaderBackend() { memset(&m_info,0,sizeof(m_info)); }
    SoundReaderBackend(const SoundReaderBackend& other) = delete;
    SoundReaderBackend& operator=(const SoundReaderBackend& other) = delete;
    ~SoundReaderBackend();

    // Return false if the file could not be opened or has unknown format
    bool Open(const char *path, bool silent);

    int GetSampleRate() const { return m_info.samplerate; }
    int GetChannelCnt() const { return m_info.channels; }
    int64_t GetLength() const { return ((int64_t) m_info.frames)*m_info.channels; }

    // libsndfile requires that we read full tuples.
    // Use a reasonably large multiple of that, but small enough to fit in caches.
    int GetBlockSize() const { return 2048*m_info.channels; }

    bool SetReadPos(int64_t pos);
    bool Read(short *buf, int cnt);
};

//----------------------------------------------------------------------------

SoundReaderBackend::~SoundReaderBackend()
{
    if (m_sf)
        (void) sf_close(m_sf);
}

//----------------------------------------------------------------------------

bool SoundReaderBackend::Open(const char *path, bool silent)
{
    memset(&m_info,0,sizeof(m_info));
    m_filepos = 0;
    m_sf = sf_open(path, SFM_READ, &m_info);
    if (!m_sf)
    {
        if (!silent)
            fprintf(stderr,"Could not open sound file %s: %s\n", path, sf_strerror(NULL));
        return false;
    }

    if (m_info.channels < 1 || m_info.samplerate < 1)
    {
        if (!silent)
            fprintf(stderr,"Could not open sound file %s: bad header\n", path);
        return false;
    }
    return true;
}

//----------------------------------------------------------------------------

// Seek to an absolute position, counted in samples
bool SoundReaderBackend::SetReadPos(int64_t pos)
{
    assert(pos % m_info.channels == 0);

    if (pos == m_filepos)
        return true;
    if (!m_info.seekable)
        return false;

    sf_count_t frame = sf_seek(m_sf, pos/m_info.channels, SEEK_SET);
    if (frame < 0)
    {
        fprintf(stderr, "Seek error: %s\n", sf_strerror(m_sf));
        return false;
    }
    m_filepos = ((int64_t) frame)*m_info.channels;
    return m_filepos == pos;
}

//----------------------------------------------------------------------------

// 'cnt' is counted in scalar samples (not tuples)
bool SoundReaderBackend::Read(short *buf, int cnt)
{
    assert(cnt % m_info.channels == 0);

    if (cnt==0)
        return true;

    sf_count_t got_cnt = sf_read_short(m_sf, buf, cnt);
    if (got_cnt > 0)
        m_filepos += got_cnt;

    if (got_cnt != cnt)
    {
        fprintf(stderr, "Read error: %s\n", sf_strerror(m_sf));
        return false;
    }
    return true;
}

//----------------------------------------------------------------------------
// SoundReader front-end implementation
//----------------------------------------------------------------------------

SoundReader::~SoundReader()
{
    Close();
}

//----------------------------------------------------------------------------

int SoundReader::GetSampleRate() const
{
    return m_backend ? m_backend->GetSampleRate() : 0;
}

//----------------------------------------------------------------------------

int SoundReader::GetChannelCnt() const
{
    return m_backend ? m_backend->GetChannelCnt() : 0;
}

//----------------------------------------------------------------------------

int64_t SoundReader::GetLength() const
{
    return m_backend ? m_backend->GetLength() : 0;
}

//----------------------------------------------------------------------------

int64_t SoundReader::GetReadPos() const
{
    return m_read_pos;
}

//----------------------------------------------------------------------------

// Read block into buffer, return pointer or 0 on failure
short *SoundReader::GetBlock(int64_t block_no)
{
    assert(block_no >= 0 && block_no < m_block_cnt);
    if (m_block_no == block_no)
        return m_block_buf;

    int64_t start = block_no*m_block_size;
    int size = m_block_size;
    if (block_no == m_block_cnt-1)
        size = (int) (GetLength() - start); // last block is smaller

    m_block_no = -1;
    if (!m_backend->SetReadPos(start))
        return 0;
    if (!m_backend->Read(m_block_buf, size))
        return 0;

    m_block_no = block_no;
    return m_block_buf;
}

//----------------------------------------------------------------------------

// 'cnt' is counted in scalar samples (not tuples).
// Samples are scaled to the +-1 range.
bool SoundReader::Read(float *buf, int cnt)
{
    if (cnt == 0)
        return true;
    if (!m_backend || cnt < 0 || m_read_pos+cnt > GetLength())
        return false;

    const float k = 1.0f/32768;
    while (cnt>0)
    {
        int64_t block_no = m_read_pos/m_block_size;
        int64_t block_start = block_no*m_block_size;

        int do_cnt = (int) (block_start + m_block_size - m_read_pos);
        if (do_cnt>cnt) do_cnt = cnt;

        short *block = GetBlock(block_no);
        if (!block)
            return false;

        const short *src = block + (m_read_pos - block_start);
        for (int i=0; i<do_cnt; i++)
            buf[i] = k*src[i];

        m_read_pos += do_cnt;
        buf += do_cnt;
        cnt -= do_cnt;
    }
    return true;
}

//----------------------------------------------------------------------------

bool SoundReader::Open(const char *path, bool silent /*=false*/)
{
    // Allow multiple calls to open - discard previous state
    Close();

    struct stat st;
    if (stat(path,&st))
    {
        if (!silent)
            perror(path);
        return false;
    }

    SoundReaderBackend *backend = new SoundReaderBackend();
    if (!backend->Open(path, silent))
    {
        // Error message, if any, was printed by the backend
        delete backend;
        return false;
    }

    m_backend = backend;
    int64_t length = m_backend->GetLength();
    m_block_size = m_backend->GetBlockSize();
    m_block_cnt = (length + m_block_size-1)/m_block_size;
    m_block_no = -1;
    m_block_buf = new short[m_block_size];
    return true;
}

//----------------------------------------------------------------------------

// Forget the block cache
void SoundReader::ReleaseBlocks()
{
    delete[] m_block_buf;
    m_block_buf = 0;
    m_block_size = 0;
    m_block_cnt = 0;
    m_block_no = -1;
    m_read_pos = 0;
}

//----------------------------------------------------------------------------

void SoundReader::Close()
{
    delete m_backend;
    m_backend = 0;
    ReleaseBlocks();
}
