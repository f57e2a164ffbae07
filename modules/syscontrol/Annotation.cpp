//============================================================================
//
//  Annotation helpers
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#include "Annotation.h"

//----------------------------------------------------------------------------

const char *annotation_row_name(int level)
{
    switch (level)
    {
    case ANN_BIT:     return "bit";
    case ANN_WORD:    return "word";
    case ANN_COMMAND: return "command";
    default:          return "?";
    }
}

//----------------------------------------------------------------------------

int AnnotationList::Count(int level) const
{
    int n = 0;
    for (const auto& ann: items)
        if (ann.level == level)
            n++;
    return n;
}
