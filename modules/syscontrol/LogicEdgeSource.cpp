//----------------------------------------------------------------------------
//
//  LogicEdgeSource - Edges from a raw logic analyzer dump
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#include "LogicEdgeSource.h"

#include <stdio.h>

//----------------------------------------------------------------------------

LogicEdgeSource::LogicEdgeSource(const DecoderOptions& options) :
    m_options(options)
{
}

//----------------------------------------------------------------------------

LogicEdgeSource::~LogicEdgeSource()
{
    if (m_file)
        fclose(m_file);
}

//----------------------------------------------------------------------------

bool LogicEdgeSource::Open()
{
    if (m_options.bit < 0 || m_options.bit > 7)
    {
        fprintf(stderr, "Bit %d out of range, raw dumps have bits 0..7\n", m_options.bit);
        return false;
    }

    m_file = fopen(m_options.filename, "rb");
    if (!m_file)
    {
        perror(m_options.filename);
        return false;
    }

    Configure(m_options);
    return true;
}

//----------------------------------------------------------------------------

int LogicEdgeSource::ReadLevels(uint8_t *buf, int cnt)
{
    if (!m_file)
        return -1;

    size_t n = fread(buf, 1, cnt, m_file);
    if (n < (size_t) cnt && ferror(m_file))
    {
        perror(m_options.filename);
        return -1;
    }

    for (size_t i=0; i<n; i++)
        buf[i] = (buf[i] >> m_options.bit) & 1;
    return (int) n;
}
