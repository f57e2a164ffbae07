//----------------------------------------------------------------------------
//
//  AnnotationPrinter - Print decoder output as text lines
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#include "AnnotationPrinter.h"
#include "Annotation.h"

#include <assert.h>
#include <stdio.h>
#include <tgmath.h>

//----------------------------------------------------------------------------

void print_time(FILE *f, double time)
{
    long milli = (long) floor(1000*time);
    if (milli<0)
        milli = 0;

    long secs = milli/1000;
    milli %= 1000;
    long mins = secs/60;
    secs %= 60;

    fprintf(f,"%02ld:%02ld.%03ld", mins, secs, milli);
}

//----------------------------------------------------------------------------

AnnotationPrinter::AnnotationPrinter(FILE *f, double sample_rate, int row_mask) :
    m_file(f),
    m_sample_rate(sample_rate),
    m_row_mask(row_mask)
{
}

//----------------------------------------------------------------------------

void AnnotationPrinter::Put(const Annotation& ann)
{
    assert(ann.level >= 0 && ann.level < ANN_LEVEL_CNT);
    m_counts[ann.level]++;

    if (!(m_row_mask & (1<<ann.level)))
        return;

    if (m_sample_rate > 0)
    {
        print_time(m_file, ann.start/m_sample_rate);
        fprintf(m_file, "  ");
    }
    fprintf(m_file, "%lld-%lld  %-7s  %s\n",
            (long long) ann.start, (long long) ann.end,
            annotation_row_name(ann.level), ann.text);
}

//----------------------------------------------------------------------------

int AnnotationPrinter::GetCount(int level) const
{
    assert(level >= 0 && level < ANN_LEVEL_CNT);
    return m_counts[level];
}
