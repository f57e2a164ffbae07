//----------------------------------------------------------------------------
//
//  SoundWriter implementation
//
//  Copyright (c) 2005-2024 Erik Persson
//
//----------------------------------------------------------------------------

#include "SoundWriter.h"
#include <sndfile.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>

//----------------------------------------------------------------------------
// SoundWriterBackend
//----------------------------------------------------------------------------

class SoundWriterBackend
{
    SF_INFO m_info;
    SNDFILE *m_sf = 0;
    int64_t m_write_pos = 0;
    bool m_ok = true; // cleared on first failed write

public:
    SoundWriterBackend() { memset(&m_info,0,sizeof(m_info)); }
    SoundWriterBackend(const SoundWriterBackend& other) = delete;
    SoundWriterBackend& operator=(const SoundWriterBackend& other) = delete;
    ~SoundWriterBackend() { (void) Close(); }

    bool Open(const char *path, int sample_rate);

    int GetSampleRate() const { return m_info.samplerate; }
    int64_t GetWritePos() const { return m_write_pos; }
    bool Write(const short *buf, int len);
    bool Close();
};

//----------------------------------------------------------------------------

bool SoundWriterBackend::Open(const char *path, int sample_rate)
{
    memset(&m_info,0,sizeof(m_info));
    m_info.channels = 1;
    m_info.samplerate = sample_rate;
    m_info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    if (!sf_format_check(&m_info))
    {
        fprintf(stderr,"Could not open sound file %s for writing: invalid format\n", path);
        return false;
    }

    m_sf = sf_open(path, SFM_WRITE, &m_info);
    if (!m_sf)
    {
        fprintf(stderr,"Could not open sound file %s for writing: %s\n", path, sf_strerror(NULL));
        return false;
    }

    m_write_pos = 0;
    m_ok = true;
    return true;
}

//----------------------------------------------------------------------------

bool SoundWriterBackend::Write(const short *buf, int len)
{
    if (!m_sf)
        return false;

    sf_count_t cnt = sf_write_short(m_sf, buf, len);
    if (cnt > 0)
        m_write_pos += cnt;
    if (cnt != len)
        m_ok = false;
    return cnt == len;
}

//----------------------------------------------------------------------------

bool SoundWriterBackend::Close()
{
    if (m_sf)
    {
        if (sf_close(m_sf) != 0)
            m_ok = false;
        m_sf = 0;
    }
    return m_ok;
}

//----------------------------------------------------------------------------
// SoundWriter - front end part
//----------------------------------------------------------------------------

SoundWriter::~SoundWriter()
{
    (void) Close();
}

//----------------------------------------------------------------------------

bool SoundWriter::Open(const char *path, int sample_rate)
{
    delete m_backend;
    m_backend = new SoundWriterBackend;
    if (!m_backend->Open(path, sample_rate))
    {
        delete m_backend;
        m_backend = 0;
    }
    return m_backend != 0;
}

//----------------------------------------------------------------------------

int SoundWriter::GetSampleRate() const
{
    return m_backend ? m_backend->GetSampleRate() : 0;
}

//----------------------------------------------------------------------------

int64_t SoundWriter::GetWritePos() const
{
    return m_backend ? m_backend->GetWritePos() : 0;
}

//----------------------------------------------------------------------------

bool SoundWriter::Write(const short *buf, int len)
{
    return m_backend ? m_backend->Write(buf,len) : false;
}

//----------------------------------------------------------------------------

bool SoundWriter::Write(const float *buf, int len)
{
    // Call SoundSink's default float write which converts to shorts
    return SoundSink::Write(buf, len);
}

//----------------------------------------------------------------------------

// Return false if any write or the final flush failed
bool SoundWriter::Close()
{
    if (!m_backend)
        return false;

    bool ok = m_backend->Close();
    delete m_backend;
    m_backend = 0;
    return ok;
}
