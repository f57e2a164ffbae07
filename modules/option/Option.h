//-----------------------------------------------------------------------------
//
//  Option -- command line options on top of getopt_long
//
//  Options are declared as globals and register themselves in a list.
//  Option::Parse fills them in from argv.
//
//  Copyright (c) 2006-2024 Erik Persson
//
//-----------------------------------------------------------------------------

#ifndef OPTION_H
#define OPTION_H

//-----------------------------------------------------------------------------
// Option
//-----------------------------------------------------------------------------

// Base class for different options
class Option
{
    Option *m_next;
protected:
    char m_c;                 // Character or number<=32 for no short form
    const char *m_long_name;
    const char *m_help;
    bool m_given;             // was the option given on the command line?

    static int GetCount();
    virtual bool RequiresArgument() const = 0;

    // Store argument, return false if it could not be parsed
    virtual bool Set(const char *optarg) = 0;

    // Describe expected argument in error messages
    virtual const char *GetArgumentKind() const { return "argument"; }

public:
    Option(char c, const char *long_name, const char *help);
    virtual ~Option() {}

    bool IsGiven() const { return m_given; }

    // Print the option list to stderr
    static void Help();

    // Parse command line arguments
    // Exits with status 1 on malformed command lines.
    // Returns index of first non-option argument.
    static int Parse(int argc, char **argv);
};

//-----------------------------------------------------------------------------
// BoolOption
//-----------------------------------------------------------------------------

// Flag without argument
class BoolOption : public Option
{
public:
    BoolOption(char c, const char *long_name, const char *help)
        : Option(c,long_name,help)
    {}

    operator bool() const { return m_given; }
    bool Set(const char *) override { return true; }
    bool RequiresArgument() const override { return false; }
};

//-----------------------------------------------------------------------------
// IntOption
//-----------------------------------------------------------------------------

// Integer-valued option with inclusive range
class IntOption : public Option
{
    int m_val;
    int m_min, m_max;
public:
    IntOption(char c, const char *long_name, const char *help, int default_value,
              int min_value = -2147483647-1, int max_value = 2147483647)
        : Option(c,long_name,help)
    {
        m_val = default_value;
        m_min = min_value;
        m_max = max_value;
    }

    operator int() const { return m_val; }
    bool Set(const char *optarg) override;
    bool RequiresArgument() const override { return true; }
    const char *GetArgumentKind() const override { return "integer"; }
};

//-----------------------------------------------------------------------------
// DoubleOption
//-----------------------------------------------------------------------------

// Real-valued option, e.g. a sample rate or a voltage level
class DoubleOption : public Option
{
    double m_val;
public:
    DoubleOption(char c, const char *long_name, const char *help, double default_value)
        : Option(c,long_name,help)
    {
        m_val = default_value;
    }

    operator double() const { return m_val; }
    bool Set(const char *optarg) override;
    bool RequiresArgument() const override { return true; }
    const char *GetArgumentKind() const override { return "number"; }
};

//-----------------------------------------------------------------------------
// TimeOption
//-----------------------------------------------------------------------------

// Time in seconds, given as MM:SS.CC on the command line
class TimeOption : public Option
{
    double m_val;
public:
    TimeOption(char c, const char *long_name, const char *help, double default_value)
        : Option(c,long_name,help)
    {
         m_val = default_value;
    }

    operator double() const { return m_val; }
    bool Set(const char *optarg) override;
    bool RequiresArgument() const override { return true; }
    const char *GetArgumentKind() const override { return "minutes:seconds"; }
};

#endif // OPTION_H
