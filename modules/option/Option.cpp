//=============================================================================
//
//  Option -- command line options on top of getopt_long
//
//  Copyright (c) 2006-2024 Erik Persson
//
//=============================================================================

#include "Option.h"
#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <assert.h>
#include <string.h>
#include <errno.h>
#include <tgmath.h>
#include <vector>

// Global linked list of options, most recently constructed first
static Option *g_first_option = 0;

//-----------------------------------------------------------------------------

Option::Option(char c, const char *long_name, const char *help)
{
    m_c = c;
    m_long_name = long_name;
    m_help = help;
    m_next = g_first_option; g_first_option = this;
    m_given = false;
}

//-----------------------------------------------------------------------------

// static
int Option::GetCount()
{
    int count = 0;
    for (Option *opt = g_first_option; opt; opt = opt->m_next)
        count++;
    return count;
}

//-----------------------------------------------------------------------------

// static
void Option::Help()
{
    if (!g_first_option)
    {
        fprintf(stderr,"No command line options are used\n");
        return;
    }
    fprintf(stderr,"Options are:\n");

    int longest = 0;
    for (Option *opt = g_first_option; opt; opt = opt->m_next)
    {
        int l = strlen(opt->m_long_name);
        if (l>longest) longest = l;
    }

    // Two passes: options with short form first
    for (int pass = 0; pass<2; pass++)
    {
        for (Option *opt = g_first_option; opt; opt = opt->m_next)
        {
            bool has_short = opt->m_c > 32;
            if (has_short && pass==0)
                fprintf(stderr,"  -%c --%-*s %s\n",opt->m_c,longest,opt->m_long_name,opt->m_help);
            else if (!has_short && pass==1)
                fprintf(stderr,"     --%-*s %s\n",longest,opt->m_long_name,opt->m_help);
        }
    }
}

//-----------------------------------------------------------------------------

// static
int Option::Parse(int argc, char **argv)
{
    int opt_cnt = GetCount();

    std::vector<struct option> options(opt_cnt+1);
    std::vector<char> str;
    int i = 0;
    for (Option *opt = g_first_option; opt; opt = opt->m_next, i++)
    {
        assert(i<opt_cnt);
        options[i].name = opt->m_long_name;
        options[i].has_arg = opt->RequiresArgument()? required_argument : no_argument;
        options[i].flag = NULL;
        options[i].val = opt->m_c;

        // If the character is below 32 it means no short option
        if (opt->m_c > 32)
        {
            str.push_back(opt->m_c);
            if (options[i].has_arg)
                str.push_back(':');
        }
    }
    memset(&options[opt_cnt],0,sizeof(options[opt_cnt]));
    str.push_back(0);

    while (1)
    {
        int longindex = 0;
        int c = getopt_long(argc, argv, &str[0], &options[0], &longindex);
        if (c==-1)
            break;

        Option *match = 0;
        for (Option *opt = g_first_option; opt; opt = opt->m_next)
            if (c==opt->m_c)
                match = opt;

        if (!match)
        {
            Help();
            exit(1);
        }

        match->m_given = true;
        if (match->RequiresArgument())
        {
            if (!optarg)
            {
                fprintf(stderr,"Error: Argument required for --%s\n",match->m_long_name);
                Help();
                exit(1);
            }
            if (!match->Set(optarg))
            {
                fprintf(stderr,"Invalid argument to --%s, %s expected\n",
                        match->m_long_name, match->GetArgumentKind());
                exit(1);
            }
        }
    }

    return optind;
}

//-----------------------------------------------------------------------------
// IntOption
//-----------------------------------------------------------------------------

bool IntOption::Set(const char *optarg)
{
    char *end = 0;
    errno = 0;
    long val = strtol(optarg, &end, 0); // accepts 0x prefix
    if (end == optarg || *end || errno)
        return false;
    if (val < m_min || val > m_max)
        return false;
    m_val = (int) val;
    return true;
}

//-----------------------------------------------------------------------------
// DoubleOption
//-----------------------------------------------------------------------------

bool DoubleOption::Set(const char *optarg)
{
    char *end = 0;
    errno = 0;
    double val = strtod(optarg, &end);
    if (end == optarg || errno)
        return false;

    // Allow SI suffixes, e.g. 48k or 1M for sample rates
    if (*end == 'k' || *end == 'K')
    {
        val *= 1e3;
        end++;
    }
    else if (*end == 'M')
    {
        val *= 1e6;
        end++;
    }
    if (*end)
        return false;

    m_val = val;
    return true;
}

//-----------------------------------------------------------------------------
// TimeOption
//-----------------------------------------------------------------------------

// Scan digits and return no. of digits found
static int scan_digits(const char **srcref, double *val)
{
    double y = 0;
    int n = 0;
    const char *src = *srcref;
    while (src[n]>='0' && src[n]<='9')
    {
        y = 10*y + (src[n] - '0');
        n++;
    }
    *val = y;
    (*srcref) += n;
    return n;
}

//----------------------------------------------------------------------------

// Decode time in MM:SS.CC notation, "MM:" and ".CC" being optional.
// Produce time in seconds in *result, return true if successful.
static bool parse_time(const char *src, double *result)
{
    double d = 0;
    if (scan_digits(&src, &d) < 1)
        return false;

    if (src[0] == ':' && src[1]>='0' && src[1]<='9')
    {
        // MM:SS with SS in range 0..59
        src++;
        double secs = 0;
        (void) scan_digits(&src, &secs);
        if (secs >= 60)
            return false;
        d = 60*d + secs;
    }

    if (src[0] == '.' && src[1]>='0' && src[1]<='9')
    {
        src++;
        double frac = 0;
        int n = scan_digits(&src, &frac);
        d += frac*pow(10.0,-n);
    }

    if (src[0])
        return false; // garbage at end
    *result = d;
    return true;
}

//----------------------------------------------------------------------------

bool TimeOption::Set(const char *optarg)
{
    return parse_time(optarg, &m_val);
}
