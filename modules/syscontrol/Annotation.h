//============================================================================
//
//  Annotation - Decoder output record, and interfaces to receive them
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#ifndef ANNOTATION_H
#define ANNOTATION_H

#include <stdint.h>
#include <vector>

// Annotation levels, each one shown on a row of its own
#define ANN_BIT       (0)  // Reset pulse or bit value
#define ANN_WORD      (1)  // 16-bit word in hex
#define ANN_COMMAND   (2)  // Command description
#define ANN_LEVEL_CNT (3)

#define ANN_TEXT_MAX  (32)

struct Annotation
{
    int64_t start;            // First sample covered
    int64_t end;              // Sample past the last one covered
    int level;                // ANN_BIT, ANN_WORD or ANN_COMMAND
    char text[ANN_TEXT_MAX];  // Null terminated
};

// Return row name for level: "bit", "word" or "command"
const char *annotation_row_name(int level);

//----------------------------------------------------------------------------

// AnnotationSink - receiver of decoder output
class AnnotationSink
{
public:
    virtual ~AnnotationSink() {}

    // Called once per annotation, in order of emission
    virtual void Put(const Annotation& ann) = 0;
};

//----------------------------------------------------------------------------

// AnnotationList - sink collecting everything in memory
class AnnotationList : public AnnotationSink
{
public:
    std::vector<Annotation> items;

    void Put(const Annotation& ann) override { items.push_back(ann); }

    // Count items at the given level
    int Count(int level) const;
};

#endif
