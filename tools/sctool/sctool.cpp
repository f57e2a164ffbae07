//============================================================================
//
//  sctool - A tool for decoding Kenwood SYSTEM CONTROL captures
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#include <syscontrol/SysControlDecoder.h>
#include <syscontrol/AnnotationPrinter.h>
#include <syscontrol/CommandEncoder.h>
#include <syscontrol/CommandTable.h>
#include <syscontrol/LogicEdgeSource.h>
#include <syscontrol/WaveEdgeSource.h>
#include <soundio/SoundReader.h>
#include <option/Option.h>

#include <vector>

#include <stdlib.h>
#include <stdio.h>

#define VERSION "1.0.0"

//----------------------------------------------------------------------------
// Command line options
//----------------------------------------------------------------------------

// Command flags
BoolOption g_help('h',"help", "Show command line syntax");
BoolOption g_version('V',"version", "Print program version");
BoolOption g_decode('d',"decode", "Decode capture to annotations");
BoolOption g_encode('e',"encode", "Encode words into waveform");
BoolOption g_table('t',"table", "List known commands");

// Input selection
DoubleOption g_sample_rate('r',"samplerate", "Sample rate in Hz, required for raw dumps", 0);
BoolOption g_raw('R',"raw", "Input is a raw logic dump, one byte per sample");
IntOption g_bit('b',"bit", "Bit carrying the data line in raw dump (default 0)", 0, 0, 7);
IntOption g_channel('c',"channel", "Channel carrying the data line in sound file (default 0)", 0, 0);
TimeOption g_start('S',"start", "Specify start time in minutes:seconds notation", -1);
TimeOption g_end('E',"end", "Specify end time in minutes:seconds notation", -1);

// Sub-options to the Schmitt trigger
DoubleOption g_threshold(1, "threshold", "Trigger level, full scale is +-1 (default 0)", 0);
DoubleOption g_hysteresis(2, "hysteresis", "Trigger hysteresis width (default 0.1)", 0.1);
BoolOption g_invert('i',"invert", "Invert logic levels");

// Output selection
BoolOption g_bits(10, "bits", "Show reset and bit row");
BoolOption g_words(11, "words", "Show word row");
BoolOption g_commands(12, "commands", "Show command row");
BoolOption g_verbose('v',"verbose", "Print diagnostic information");

//----------------------------------------------------------------------------
// Help command
//----------------------------------------------------------------------------

static int help(const char *progname)
{
    fprintf(stderr,"Usage: %s -h/--help\n",progname);
    fprintf(stderr,"       %s -V/--version\n",progname);
    fprintf(stderr,"       %s -d/--decode [options] <in.wav/bin>\n",progname);
    fprintf(stderr,"       %s -e/--encode [options] <out.wav> <word> [<word> ...]\n",progname);
    fprintf(stderr,"       %s -t/--table\n",progname);
    fprintf(stderr,"\n");
    Option::Help(); // list command line flags
    return 0;
}

//----------------------------------------------------------------------------
// Version command
//----------------------------------------------------------------------------

static int version()
{
    printf("sctool version " VERSION "\n");
    return 0;
}

//----------------------------------------------------------------------------
// Decode command
//----------------------------------------------------------------------------

static int run_decoder(const DecoderOptions& options, EdgeSource *src, int row_mask)
{
    AnnotationPrinter printer(stdout, src->GetSampleRate(), row_mask);
    SysControlDecoder dec(options, &printer);

    DecodeStatus status = dec.Decode(src);
    if (status == DecodeStatus::MissingSampleRate)
    {
        fprintf(stderr, "Error: Cannot decode without samplerate\n");
        return 1;
    }

    if (options.verbose)
        printf("Decoded %d words\n", printer.GetCount(ANN_WORD));
    return 0;
}

//----------------------------------------------------------------------------

// Print annotations for a waveform or logic dump
// Return command status (0=success)
static int decode(const DecoderOptions& options, int row_mask)
{
    if (options.verbose)
        printf("Decoding %s\n", options.filename);

    if (options.raw)
    {
        LogicEdgeSource src(options);
        if (!src.Open())
            return 1;
        int status = run_decoder(options, &src, row_mask);
        if (src.HasError())
            status = 1;
        return status;
    }

    SoundReader reader;
    if (!reader.Open(options.filename))
        return 1;

    WaveEdgeSource src(&reader, options);
    if (!src.IsOk())
    {
        fprintf(stderr, "Error: %s has no channel %d\n", options.filename, options.channel);
        return 1;
    }

    int status = run_decoder(options, &src, row_mask);
    if (src.HasError())
    {
        fprintf(stderr, "Error reading %s\n", options.filename);
        status = 1;
    }
    return status;
}

//----------------------------------------------------------------------------
// Encode command
//----------------------------------------------------------------------------

// Encode words to .wav
// Return command status (0=success)
static int encode(const char *oname, char **words, int word_cnt)
{
    std::vector<uint16_t> codes;
    for (int i=0; i<word_cnt; i++)
    {
        uint16_t word;
        if (!parse_command_word(words[i], &word))
        {
            fprintf(stderr, "Error: '%s' is not a 16-bit hexadecimal word\n", words[i]);
            return 1;
        }
        codes.push_back(word);
    }

    int sample_rate = g_sample_rate > 0 ? (int) g_sample_rate : ENCODER_RATE;
    printf("Encoding %d words to WAV file %s\n", word_cnt, oname);

    CommandEncoder enc;
    if (enc.Open(oname, sample_rate))
    {
        for (uint16_t word: codes)
        {
            if (g_verbose)
                printf("0x%04x  %s\n", (unsigned) word, lookup_command(word));
            enc.PutWord(word);
        }
        double duration = enc.GetDuration();
        if (enc.Close())
        {
            if (g_verbose)
                printf("Wrote %.3f s at %d Hz\n", duration, sample_rate);
            return 0; // success
        }
    }

    fprintf(stderr, "Error: Write to %s failed\n", oname);
    return 1;
}

//----------------------------------------------------------------------------
// Table command
//----------------------------------------------------------------------------

// List the command table in definition order.
// Entries hidden by a later entry for the same code are marked.
static int table()
{
    for (int i=0; i<g_command_table_len; i++)
    {
        const CommandEntry& e = g_command_table[i];
        printf("0x%04x  %-16s%s\n", (unsigned) e.code, e.description,
               is_command_overridden(i) ? "  (overridden)" : "");
    }
    return 0;
}

//----------------------------------------------------------------------------
// main
//----------------------------------------------------------------------------

int main(int argc, char **argv)
{
    int optind= Option::Parse(argc,argv);

    int commands_given = 0 +
                         g_help +
                         g_version +
                         g_decode +
                         g_encode +
                         g_table;

    // Non option arguments are filenames, and words for --encode
    int filename_cnt = argc-optind;
    const char *filename0 = filename_cnt>=1 ? argv[optind] : 0;

    bool illegal_options = false;

    if (commands_given != 1)
    {
        fprintf(stderr, "Error: %d commands specified, one expected\n", commands_given);
        illegal_options = true;
    }

    if (!illegal_options)
    {
        if (g_encode)
        {
            if (filename_cnt < 2)
            {
                fprintf(stderr, "Error: Output filename and at least one word expected\n");
                illegal_options = true;
            }
        }
        else
        {
            int filename_cnt_expected = g_decode ? 1 : 0;
            if (filename_cnt != filename_cnt_expected)
            {
                fprintf(stderr, "Error: %d filename(s) provided but %d expected\n",
                    filename_cnt,
                    filename_cnt_expected);
                illegal_options = true;
            }
        }
    }

    if (g_bit.IsGiven() && !g_raw)
        fprintf(stderr, "Warning: Option --bit/-b has no effect without --raw/-R\n");

    if (g_channel.IsGiven() && g_raw)
        fprintf(stderr, "Warning: Option --channel/-c has no effect with --raw/-R\n");

    if (g_start >= 0 && g_end >= 0 && g_end <= g_start)
    {
        fprintf(stderr, "Error: End time must be after start time\n");
        illegal_options = true;
    }

    if (g_hysteresis < 0)
    {
        fprintf(stderr, "Error: Hysteresis can't be negative\n");
        illegal_options = true;
    }

    DecoderOptions options;
    options.filename = filename0;
    options.start = g_start;
    options.end = g_end;
    options.sample_rate = g_sample_rate;
    options.raw = g_raw;
    options.bit = g_bit;
    options.channel = g_channel;
    options.threshold = g_threshold;
    options.hysteresis = g_hysteresis;
    options.invert = g_invert;
    options.verbose = g_verbose;

    int row_mask = (g_bits ? ROW_BITS : 0) |
                   (g_words ? ROW_WORDS : 0) |
                   (g_commands ? ROW_COMMANDS : 0);
    if (!row_mask)
        row_mask = ROW_ALL;

    if (illegal_options)
    {
        (void) help(argv[0]);
        exit(1);
    }

    if (g_help)
        return help(argv[0]);

    if (g_version)
        return version();

    if (g_decode)
        return decode(options, row_mask);

    if (g_encode)
        return encode(filename0, argv+optind+1, filename_cnt-1);

    if (g_table)
        return table();

    return 1; // should not come here
}
