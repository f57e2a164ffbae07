//----------------------------------------------------------------------------
//
//  AnnotationPrinter - Print decoder output as text lines
//
//  Copyright (c) 2024 Erik Persson
//
//----------------------------------------------------------------------------

#ifndef ANNOTATIONPRINTER_H
#define ANNOTATIONPRINTER_H

#include "Annotation.h"

#include <stdio.h>

// Row selection masks
#define ROW_BITS     (1<<ANN_BIT)
#define ROW_WORDS    (1<<ANN_WORD)
#define ROW_COMMANDS (1<<ANN_COMMAND)
#define ROW_ALL      (ROW_BITS|ROW_WORDS|ROW_COMMANDS)

// Prints lines like
// 00:01.234  52910-53131  bit      RESET
class AnnotationPrinter : public AnnotationSink
{
    FILE *m_file;
    double m_sample_rate;
    int m_row_mask;
    int m_counts[ANN_LEVEL_CNT] = { 0, 0, 0 };

public:
    AnnotationPrinter(FILE *f, double sample_rate, int row_mask = ROW_ALL);

    void Put(const Annotation& ann) override;

    // No. of annotations seen at level, printed or not
    int GetCount(int level) const;
};

// Print time in MM:SS.mmm format
void print_time(FILE *f, double time);

#endif
