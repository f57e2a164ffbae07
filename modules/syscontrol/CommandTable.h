//============================================================================
//
//  CommandTable - Descriptions of SYSTEM CONTROL command words
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#ifndef COMMANDTABLE_H
#define COMMANDTABLE_H

#include <stdint.h>

#define COMMAND_UNKNOWN "????"

struct CommandEntry
{
    uint16_t code;
    const char *description;
};

// The table in definition order. A code may appear more than once,
// in which case the later entry is the one in effect.
extern const CommandEntry g_command_table[];
extern const int g_command_table_len;

// Return description of word, COMMAND_UNKNOWN if not in table
const char *lookup_command(uint16_t code);

// Return true if the entry at index is overridden by a later one
bool is_command_overridden(int index);

// Parse a word written in hex, with or without 0x prefix.
// Signs, whitespace and values above 0xffff are refused.
bool parse_command_word(const char *s, uint16_t *word);

#endif
