//============================================================================
//
//  CommandTable - Descriptions of SYSTEM CONTROL command words
//
//  Collected by listening in on an amplifier talking to its tape deck and
//  minidisc. Most words go from the amplifier to the peripherals.
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#include "CommandTable.h"

#include <ctype.h>
#include <stdlib.h>

//----------------------------------------------------------------------------

const CommandEntry g_command_table[] =
{
    // Power and source selection
    { 0x1000, "System ON" },
    { 0x1080, "System OFF" },
    { 0x8044, "Source: CD" },
    { 0x8045, "CD ON" },
    { 0x8084, "Source: FM" },
    { 0x8085, "FM ON" },
    { 0x80a4, "Source: Tape" },
    { 0x80a5, "Tape ON" },      // could also be source select
    { 0x80b4, "Source: MD" },
    { 0x80b5, "MD ON" },        // could also be source select
    { 0x80c4, "Source: AUX" },
    { 0x80c5, "AUX ON" },
    { 0x0898, "ON3" },          // to minidisc?

    { 0x857b, "Seek Rev" },
    { 0x85fb, "Seek Fwd" },

    { 0x04c9, "Tape: ACK?" },   // from tape deck

    { 0x051b, "Tape Rev" },
    { 0x059b, "Tape Fwd" },
    { 0x05bb, "Tape Stop" },

    { 0x851b, "MD Play/Pause" },
    { 0x859b, "MD Stop" },

    // These two reuse the codes of "Source: CD" and "CD ON" above
    // and take precedence over them
    { 0x8045, "CD Play/Pause" },
    { 0x8044, "CD Stop" },

    { 0x4590, "Tape OTE" },
    { 0x0503, "MD OTE" },

    // Keypad
    { 0x0581, "Num 1 down" },
    { 0x0541, "Num 2 down" },
    { 0x05c1, "Num 3 down" },
    { 0x0521, "Num 4 down" },
    { 0x05a1, "Num 5 down" },
    { 0x0561, "Num 6 down" },
    { 0x05e1, "Num 7 down" },
    { 0x0511, "Num 8 down" },
    { 0x0591, "Num 9 down" },
    { 0x05b0, "Num +10 down" },
    { 0x0501, "Num 0 down" },
    { 0x45f2, "Num +100 down" },
    { 0x8078, "Button up" },
};

const int g_command_table_len = sizeof(g_command_table)/sizeof(g_command_table[0]);

//----------------------------------------------------------------------------

const char *lookup_command(uint16_t code)
{
    // Scan backwards so that the last definition wins
    for (int i = g_command_table_len-1; i>=0; i--)
        if (g_command_table[i].code == code)
            return g_command_table[i].description;
    return COMMAND_UNKNOWN;
}

//----------------------------------------------------------------------------

bool is_command_overridden(int index)
{
    for (int i = index+1; i<g_command_table_len; i++)
        if (g_command_table[i].code == g_command_table[index].code)
            return true;
    return false;
}

//----------------------------------------------------------------------------

bool parse_command_word(const char *s, uint16_t *word)
{
    const char *digits = s;
    if (digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X'))
        digits += 2;

    // Only digits, strtoul alone would take whitespace, a sign or a second prefix
    if (!digits[0])
        return false;
    for (const char *p = digits; *p; p++)
        if (!isxdigit((unsigned char) *p))
            return false;

    unsigned long val = strtoul(digits, 0, 16);
    if (val > 0xffff)
        return false;
    *word = (uint16_t) val;
    return true;
}
