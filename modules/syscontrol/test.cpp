//============================================================================
//
//  Test program for syscontrol
//
//  Copyright (c) 2024 Erik Persson
//
//============================================================================

#include <syscontrol/SysControlDecoder.h>
#include <syscontrol/AnnotationPrinter.h>
#include <syscontrol/CommandEncoder.h>
#include <syscontrol/CommandTable.h>
#include <syscontrol/EdgeList.h>
#include <syscontrol/LogicEdgeSource.h>
#include <syscontrol/WaveEdgeSource.h>
#include <soundio/SoundReader.h>
#include <soundio/SoundWriter.h>

#include <string>
#include <vector>

#include <assert.h>
#include <stdarg.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <tgmath.h>
#include <unistd.h>

//----------------------------------------------------------------------------
// Test bookkeeping
//----------------------------------------------------------------------------

static const char *g_test_name = 0;
static bool g_test_ok = true;

static void begin_test(const char *name)
{
    printf("Running %s test\n", name);
    g_test_name = name;
    g_test_ok = true;
}

static void check(bool cond, const char *fmt, ...)
{
    if (cond)
        return;

    printf("  Check failed: ");
    va_list ap;
    va_start(ap, fmt);
    (void) vprintf(fmt, ap);
    va_end(ap);
    printf("\n");
    g_test_ok = false;
}

static void end_test()
{
    if (g_test_ok)
    {
        printf("  Test successful\n");
    }
    else
    {
        printf("  Test %s failed\n", g_test_name);
        exit(1);
    }
}

//----------------------------------------------------------------------------
// Signal construction
//----------------------------------------------------------------------------

// Timing in samples at 10 kHz, i.e. 100 us per sample
#define T_RATE  (10000)
#define T_GAP   (100)  // low between words
#define T_RESET (50)   // 5000 us high
#define T_ZERO  (20)   // low, gives 4000 us falling-to-falling
#define T_ONE   (50)   // low, gives 7000 us falling-to-falling
#define T_HIGH  (20)   // high after each bit

// Append logic levels for one word, starting with an idle gap.
// Record where the reset pulse starts.
static void put_word_levels(std::vector<uint8_t> *levels, uint16_t word,
                            std::vector<int64_t> *command_starts = 0)
{
    levels->insert(levels->end(), T_GAP, 0);
    if (command_starts)
        command_starts->push_back(levels->size());
    levels->insert(levels->end(), T_RESET, 1);
    for (int i=15; i>=0; i--)
    {
        levels->insert(levels->end(), (word>>i)&1 ? T_ONE : T_ZERO, 0);
        levels->insert(levels->end(), T_HIGH, 1);
    }
}

//----------------------------------------------------------------------------

// Convert levels to edges the same way SampledEdgeSource does
static void levels_to_edges(const std::vector<uint8_t>& levels, EdgeList *edges)
{
    for (size_t i=1; i<levels.size(); i++)
        if (levels[i] != levels[i-1])
        {
            bool ok = edges->Add(i, levels[i] != 0);
            assert(ok);
            (void) ok;
        }
}

//----------------------------------------------------------------------------

static void put_word_edges(EdgeList *edges, const uint16_t *words, int cnt)
{
    std::vector<uint8_t> levels;
    for (int i=0; i<cnt; i++)
        put_word_levels(&levels, words[i]);
    levels.insert(levels.end(), T_GAP, 0);
    levels_to_edges(levels, edges);
}

//----------------------------------------------------------------------------

static Edge make_edge(int64_t pos, bool rising)
{
    Edge e;
    e.pos = pos;
    e.rising = rising;
    return e;
}

//----------------------------------------------------------------------------

// Feed one edge to a decoder that has a sample rate
static void put_edge(SysControlDecoder *dec, int64_t pos, bool rising)
{
    DecodeStatus status = dec->PutEdge(make_edge(pos, rising));
    check(status == DecodeStatus::Ok, "edge at %lld refused", (long long) pos);
}

//----------------------------------------------------------------------------

static bool same_annotations(const AnnotationList& a, const AnnotationList& b)
{
    if (a.items.size() != b.items.size())
        return false;
    for (size_t i=0; i<a.items.size(); i++)
    {
        const Annotation& x = a.items[i];
        const Annotation& y = b.items[i];
        if (x.start != y.start || x.end != y.end || x.level != y.level ||
            strcmp(x.text, y.text) != 0)
            return false;
    }
    return true;
}

//----------------------------------------------------------------------------

// Collect the text of all annotations at a level
static std::vector<const char *> texts_at(const AnnotationList& list, int level)
{
    std::vector<const char *> texts;
    for (const auto& ann: list.items)
        if (ann.level == level)
            texts.push_back(ann.text);
    return texts;
}

//----------------------------------------------------------------------------
// Protocol scenarios
//----------------------------------------------------------------------------

static void reset_and_first_bit_test()
{
    begin_test("reset and first bit");

    DecoderOptions options;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    dec.SetSampleRate(T_RATE);

    check(dec.GetState() == DecoderState::FindReset, "initial state");
    check(dec.GetWantedEdges() == EDGE_ANY, "waits for any edge initially");

    // 50 samples of 100 us high, 5000 us > 4000 us
    check(dec.PutEdge(make_edge(0, true)) == DecodeStatus::Ok, "rising edge accepted");
    check(dec.PutEdge(make_edge(50, false)) == DecodeStatus::Ok, "falling edge accepted");

    check(out.items.size() == 1, "one annotation after reset, got %d", (int) out.items.size());
    if (out.items.size() == 1)
    {
        const Annotation& a = out.items[0];
        check(a.start == 0 && a.end == 50, "reset spans [0,50), got [%lld,%lld)",
              (long long) a.start, (long long) a.end);
        check(a.level == ANN_BIT, "reset is on bit row");
        check(strcmp(a.text, "RESET") == 0, "reset text is %s", a.text);
    }
    check(dec.GetState() == DecoderState::ReadingBits, "reading bits after reset");
    check(dec.GetWantedEdges() == EDGE_FALLING, "waits for falling edges only");

    // 35 samples, 3500 us: a zero
    put_edge(&dec, 85, false);
    check(out.items.size() == 2, "bit annotation emitted");
    if (out.items.size() == 2)
    {
        const Annotation& a = out.items[1];
        check(a.start == 50 && a.end == 85, "bit spans [50,85)");
        check(strcmp(a.text, "0") == 0, "bit value 0, got %s", a.text);
    }
    check(dec.GetBitCount() == 1 && dec.GetContent() == 0, "one zero bit collected");

    end_test();
}

//----------------------------------------------------------------------------

static void system_on_test()
{
    begin_test("System ON word");

    const uint16_t word = 0x1000;
    EdgeList edges(T_RATE);
    put_word_edges(&edges, &word, 1);

    DecoderOptions options;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    check(dec.Decode(&edges) == DecodeStatus::Ok, "decode status");

    // RESET, 16 bits, word, command
    check(out.items.size() == 19, "19 annotations, got %d", (int) out.items.size());
    if (out.items.size() == 19)
    {
        const Annotation& reset = out.items[0];
        const Annotation& last_bit = out.items[16];
        const Annotation& w = out.items[17];
        const Annotation& c = out.items[18];

        check(reset.start == T_GAP && reset.end == T_GAP+T_RESET, "reset position");
        for (int i=0; i<16; i++)
        {
            const char *expected = i==3 ? "1" : "0";
            check(strcmp(out.items[1+i].text, expected) == 0, "bit %d is %s", i, expected);
        }

        check(w.level == ANN_WORD && strcmp(w.text, "0x1000") == 0, "word text %s", w.text);
        check(w.start == reset.end, "word starts at end of reset");
        check(w.end == last_bit.end, "word ends at last falling edge");

        check(c.level == ANN_COMMAND && strcmp(c.text, "System ON") == 0, "command text %s", c.text);
        check(c.start == reset.start, "command starts at start of reset");
        check(c.end == last_bit.end, "command ends at last falling edge");
    }
    check(dec.GetState() == DecoderState::FindReset, "back to finding reset");

    end_test();
}

//----------------------------------------------------------------------------

static void ignored_interval_test()
{
    begin_test("out of band interval");

    DecoderOptions options;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    dec.SetSampleRate(T_RATE);

    put_edge(&dec, 0, true);
    put_edge(&dec, 50, false);
    put_edge(&dec, 90, false);  // 4000 us, bit 0
    check(dec.GetBitCount() == 1, "one bit");

    size_t n = out.items.size();
    put_edge(&dec, 145, false); // 5500 us, between bands
    check(dec.GetBitCount() == 1, "bit count unchanged");
    check(out.items.size() == n, "no annotation for ignored interval");
    check(dec.GetLastFalling() == 145, "last falling edge advanced");
    check(dec.GetState() == DecoderState::ReadingBits, "still reading bits");

    // Next interval is measured from the ignored edge
    put_edge(&dec, 215, false); // 7000 us, bit 1
    check(dec.GetBitCount() == 2 && dec.GetContent() == 1, "bit 1 appended");
    check(out.items.back().start == 145, "bit starts at ignored edge");

    end_test();
}

//----------------------------------------------------------------------------

static void missing_sample_rate_test()
{
    begin_test("missing sample rate");

    const uint16_t word = 0x1000;
    EdgeList edges(0); // no sample rate known
    put_word_edges(&edges, &word, 1);
    size_t before = edges.GetRemaining();

    DecoderOptions options;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    check(!dec.HasSampleRate(), "no sample rate");
    check(dec.Decode(&edges) == DecodeStatus::MissingSampleRate, "decode fails");
    check(edges.GetRemaining() == before && before == edges.GetCount(), "no edge consumed");
    check(out.items.empty(), "nothing emitted");
    check(dec.PutEdge(make_edge(0, true)) == DecodeStatus::MissingSampleRate,
          "single edge refused");

    // Rate given later makes the same decoder usable
    dec.SetSampleRate(T_RATE);
    check(dec.Decode(&edges) == DecodeStatus::Ok, "decode with sample rate");
    check(out.Count(ANN_COMMAND) == 1, "one command decoded");

    end_test();
}

//----------------------------------------------------------------------------
// Timing windows
//----------------------------------------------------------------------------

// Feed a reset and one interval of d us at 1 MHz.
// Return bit value or -1 if no bit was appended.
static int classify(double d)
{
    DecoderOptions options;
    options.sample_rate = 1e6;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    put_edge(&dec, 0, true);
    put_edge(&dec, 5000, false);
    put_edge(&dec, 5000 + (int64_t) d, false);
    if (dec.GetBitCount() == 0)
        return -1;
    return dec.GetContent() & 1;
}

static void timing_window_test()
{
    begin_test("timing window");

    struct { int us; int bit; } cases[] =
    {
        { 2999, -1 }, { 3000, -1 }, { 3001,  0 }, { 4000,  0 },
        { 4999,  0 }, { 5000, -1 }, { 5001, -1 }, { 5500, -1 },
        { 5999, -1 }, { 6000, -1 }, { 6001,  1 }, { 7000,  1 },
        { 7999,  1 }, { 8000, -1 }, { 8001, -1 }, { 20000, -1 },
    };
    for (const auto& c: cases)
    {
        int bit = classify(c.us);
        check(bit == c.bit, "%d us gave %d, expected %d", c.us, bit, c.bit);
    }

    // Reset needs strictly more than 4000 us
    for (int high = 3999; high <= 4001; high++)
    {
        DecoderOptions options;
        options.sample_rate = 1e6;
        AnnotationList out;
        SysControlDecoder dec(options, &out);
        put_edge(&dec, 100, true);
        put_edge(&dec, 100 + high, false);
        bool is_reset = dec.GetState() == DecoderState::ReadingBits;
        check(is_reset == (high > 4000), "%d us high, reset=%d", high, (int) is_reset);
        check(out.items.size() == (is_reset ? 1u : 0u), "reset annotation iff reset");
    }

    end_test();
}

//----------------------------------------------------------------------------

static void no_rising_edge_test()
{
    begin_test("falling edge before any rising edge");

    DecoderOptions options;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    dec.SetSampleRate(T_RATE);

    // Line starts high. 1 s after start would look like a reset if the
    // missing rising edge were taken to be at position -1.
    put_edge(&dec, 10000, false);
    check(dec.GetState() == DecoderState::FindReset, "no reset");
    check(out.items.empty(), "nothing emitted");
    check(dec.GetLastRising() == -1, "no rising edge recorded");

    put_edge(&dec, 10100, true);
    put_edge(&dec, 10160, false);
    check(dec.GetState() == DecoderState::ReadingBits, "reset after real rising edge");

    end_test();
}

//----------------------------------------------------------------------------

static void custom_timing_test()
{
    begin_test("custom timing windows");

    // Twice as slow as nominal
    DecoderOptions options;
    options.reset_min_us = 8000;
    options.zero_min_us = 6000;
    options.zero_max_us = 10000;
    options.one_min_us = 12000;
    options.one_max_us = 16000;
    options.sample_rate = T_RATE/2;

    const uint16_t word = 0x1080;
    EdgeList edges; // rate comes from options
    put_word_edges(&edges, &word, 1);

    AnnotationList out;
    SysControlDecoder dec(options, &out);
    check(dec.Decode(&edges) == DecodeStatus::Ok, "decode status");
    auto commands = texts_at(out, ANN_COMMAND);
    check(commands.size() == 1 && strcmp(commands[0], "System OFF") == 0, "System OFF decoded");

    end_test();
}

//----------------------------------------------------------------------------
// Stream behavior
//----------------------------------------------------------------------------

static void multiple_words_test()
{
    begin_test("multiple words");

    const uint16_t words[] = { 0x1000, 0x80b4, 0x851b, 0x0591, 0x8078, 0x1234, 0x1080 };
    const char *expected[] =
    {
        "System ON", "Source: MD", "MD Play/Pause", "Num 9 down", "Button up",
        COMMAND_UNKNOWN, "System OFF"
    };
    const int N = sizeof(words)/sizeof(words[0]);

    EdgeList edges(T_RATE);
    put_word_edges(&edges, words, N);

    DecoderOptions options;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    check(dec.Decode(&edges) == DecodeStatus::Ok, "decode status");

    auto commands = texts_at(out, ANN_COMMAND);
    check((int) commands.size() == N, "%d commands, got %d", N, (int) commands.size());
    for (int i=0; i<N && i<(int) commands.size(); i++)
        check(strcmp(commands[i], expected[i]) == 0, "command %d is %s, got %s",
              i, expected[i], commands[i]);

    end_test();
}

//----------------------------------------------------------------------------

static void truncated_word_test()
{
    begin_test("truncated word");

    // Reset and 15 bits, then the data ends
    std::vector<uint8_t> levels;
    put_word_levels(&levels, 0xffff);
    levels.resize(levels.size() - T_HIGH - T_ONE); // drop last bit
    levels.push_back(0);
    EdgeList edges(T_RATE);
    levels_to_edges(levels, &edges);

    DecoderOptions options;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    check(dec.Decode(&edges) == DecodeStatus::Ok, "end of data mid-word is not an error");
    check(dec.GetBitCount() == 15, "15 bits collected, got %d", dec.GetBitCount());
    check(out.Count(ANN_WORD) == 0, "no word emitted");
    check(out.Count(ANN_COMMAND) == 0, "no command emitted");
    check(dec.GetState() == DecoderState::ReadingBits, "still reading bits");

    end_test();
}

//----------------------------------------------------------------------------

static void session_reset_test()
{
    begin_test("session reset");

    DecoderOptions options;
    AnnotationList out;
    SysControlDecoder dec(options, &out);
    dec.SetSampleRate(T_RATE);
    put_edge(&dec, 0, true);
    put_edge(&dec, 50, false);
    put_edge(&dec, 90, false);

    dec.Reset();
    check(dec.GetState() == DecoderState::FindReset, "state");
    check(dec.GetBitCount() == 0 && dec.GetContent() == 0, "accumulator");
    check(dec.GetLastRising() == -1 && dec.GetLastFalling() == -1, "edge positions");
    check(dec.HasSampleRate(), "sample rate kept");

    end_test();
}

//----------------------------------------------------------------------------

// Cheap deterministic pseudo random generator
static uint32_t g_seed = 12345;
static int rand_below(int n)
{
    g_seed = g_seed*1103515245 + 12345;
    return (int) ((g_seed >> 8) % (uint32_t) n);
}

// Random pulse train: phases of 1..100 samples at 10 kHz
static void random_edges(EdgeList *edges, int cnt)
{
    int64_t pos = 0;
    bool level = false;
    for (int i=0; i<cnt; i++)
    {
        pos += 1 + rand_below(100);
        level = !level;
        edges->Add(pos, level);
    }
}

static void random_signal_test()
{
    begin_test("random signal");

    EdgeList edges(T_RATE);
    random_edges(&edges, 200000);

    DecoderOptions options;
    AnnotationList out1, out2;
    SysControlDecoder dec1(options, &out1);
    SysControlDecoder dec2(options, &out2);
    check(dec1.Decode(&edges) == DecodeStatus::Ok, "first decode");
    edges.Rewind();
    check(dec2.Decode(&edges) == DecodeStatus::Ok, "second decode");

    check(same_annotations(out1, out2), "independent decoders agree");
    check(out1.Count(ANN_WORD) > 0, "some words found in noise");

    // Every word needs 16 bits since the latest reset
    int bits = -1;
    bool ok = true;
    for (const auto& ann: out1.items)
    {
        if (ann.level == ANN_BIT)
        {
            if (strcmp(ann.text, "RESET") == 0)
                bits = 0;
            else if (bits >= 0)
                bits++;
            else
                ok = false; // bit without reset
        }
        else if (ann.level == ANN_WORD)
        {
            if (bits != 16)
                ok = false;
        }
        else if (ann.level == ANN_COMMAND)
        {
            bits = -1;
        }
        if (ann.start > ann.end)
            ok = false;
    }
    check(ok, "words only after 16 bits, and start <= end");
    check(out1.Count(ANN_WORD) == out1.Count(ANN_COMMAND), "one command per word");

    end_test();
}

//----------------------------------------------------------------------------

static void hex_text_test()
{
    begin_test("word text");

    const uint16_t words[] = { 0x0000, 0x0001, 0x00ff, 0x8045, 0xabcd, 0xffff };
    for (uint16_t word: words)
    {
        EdgeList edges(T_RATE);
        put_word_edges(&edges, &word, 1);

        DecoderOptions options;
        AnnotationList out;
        SysControlDecoder dec(options, &out);
        check(dec.Decode(&edges) == DecodeStatus::Ok, "decode status");

        auto texts = texts_at(out, ANN_WORD);
        check(texts.size() == 1, "one word for %04x", word);
        if (texts.size() != 1)
            continue;

        const char *t = texts[0];
        check(strlen(t) == 6 && t[0] == '0' && t[1] == 'x', "format of %s", t);
        for (int i=2; t[i]; i++)
            check((t[i]>='0' && t[i]<='9') || (t[i]>='a' && t[i]<='f'), "lowercase hex %s", t);
        check(strtol(t, 0, 16) == word, "%s parses back to %04x", t, word);
    }

    end_test();
}

//----------------------------------------------------------------------------

static void command_table_test()
{
    begin_test("command table");

    // Later definitions of the same code take precedence
    check(strcmp(lookup_command(0x8044), "CD Stop") == 0, "0x8044");
    check(strcmp(lookup_command(0x8045), "CD Play/Pause") == 0, "0x8045");

    check(strcmp(lookup_command(0x1000), "System ON") == 0, "0x1000");
    check(strcmp(lookup_command(0x8084), "Source: FM") == 0, "0x8084");
    check(strcmp(lookup_command(0x857b), "Seek Rev") == 0, "0x857b");
    check(strcmp(lookup_command(0x85fb), "Seek Fwd") == 0, "0x85fb");
    check(strcmp(lookup_command(0x05b0), "Num +10 down") == 0, "0x05b0");
    check(strcmp(lookup_command(0x45f2), "Num +100 down") == 0, "0x45f2");
    check(strcmp(lookup_command(0x0000), COMMAND_UNKNOWN) == 0, "unmapped");
    check(strcmp(lookup_command(0xffff), "????") == 0, "unmapped text");

    int overridden = 0;
    for (int i=0; i<g_command_table_len; i++)
        if (is_command_overridden(i))
        {
            overridden++;
            uint16_t code = g_command_table[i].code;
            check(code == 0x8044 || code == 0x8045, "unexpected duplicate %04x", code);
        }
    check(overridden == 2, "two overridden entries, got %d", overridden);

    end_test();
}

//----------------------------------------------------------------------------

static void word_parsing_test()
{
    begin_test("word parsing");

    struct { const char *text; int word; } cases[] =
    {
        { "1000",   0x1000 },
        { "0x1000", 0x1000 },
        { "0X85fb", 0x85fb },
        { "ABCD",   0xabcd },
        { "0",      0x0000 },
        { "ffff",   0xffff },
        { "00001",  0x0001 },
        { "",       -1 },
        { "0x",     -1 },
        { "-0",     -1 },
        { "+1000",  -1 },
        { " 1000",  -1 },
        { "1000 ",  -1 },
        { "0x0x10", -1 },
        { "10000",  -1 },
        { "12g4",   -1 },
        { "ffffffffffffffffffff", -1 },
    };
    for (const auto& c: cases)
    {
        uint16_t word = 0;
        bool ok = parse_command_word(c.text, &word);
        if (c.word < 0)
            check(!ok, "'%s' refused", c.text);
        else
            check(ok && word == c.word, "'%s' gives %04x", c.text, c.word);
    }

    end_test();
}

//----------------------------------------------------------------------------

static Annotation make_annotation(int64_t start, int64_t end, int level, const char *text)
{
    Annotation ann;
    ann.start = start;
    ann.end = end;
    ann.level = level;
    snprintf(ann.text, sizeof(ann.text), "%s", text);
    return ann;
}

// Read back what was printed to f
static std::string read_back(FILE *f)
{
    std::string str;
    rewind(f);
    int c;
    while ((c = fgetc(f)) != EOF)
        str += (char) c;
    return str;
}

static void printer_test()
{
    begin_test("annotation printer");

    FILE *f = tmpfile();
    check(f != 0, "tmpfile");
    if (!f)
    {
        end_test();
        return;
    }

    // Words and commands only, at 1 kHz
    {
        AnnotationPrinter printer(f, 1000, ROW_WORDS|ROW_COMMANDS);
        printer.Put(make_annotation(1000, 1500, ANN_BIT, "RESET"));
        printer.Put(make_annotation(1500, 61250, ANN_WORD, "0x1000"));
        printer.Put(make_annotation(61250, 61260, ANN_COMMAND, "System ON"));
        check(printer.GetCount(ANN_BIT) == 1, "filtered rows are counted");
        check(printer.GetCount(ANN_WORD) == 1 && printer.GetCount(ANN_COMMAND) == 1, "counts");
    }
    std::string text = read_back(f);
    const char *expected =
        "00:01.500  1500-61250  word     0x1000\n"
        "01:01.250  61250-61260  command  System ON\n";
    check(text == expected, "printed:\n%s", text.c_str());
    fclose(f);

    // Unknown sample rate gives no time column
    f = tmpfile();
    check(f != 0, "tmpfile");
    if (f)
    {
        AnnotationPrinter printer(f, 0);
        printer.Put(make_annotation(5, 9, ANN_BIT, "1"));
        text = read_back(f);
        check(text == "5-9  bit      1\n", "printed: %s", text.c_str());
        fclose(f);
    }

    check(strcmp(annotation_row_name(ANN_COMMAND), "command") == 0, "row name");

    end_test();
}

//----------------------------------------------------------------------------
// Loopback through files
//----------------------------------------------------------------------------

static void wave_loopback_test()
{
    begin_test("WAV loopback");

    const uint16_t words[] = { 0x1000, 0x8084, 0x857b, 0x05a1, 0x04c9, 0x1080 };
    const int N = sizeof(words)/sizeof(words[0]);

    char filename[200];
    int err = snprintf(filename, sizeof(filename), "/tmp/syscontrol_test_%d.wav", (int) getpid());
    assert(err >= 0);
    (void) err;

    printf("  Encoding to WAV file %s\n", filename);
    CommandEncoder enc;
    check(enc.Open(filename), "open %s", filename);
    for (int i=0; i<N; i++)
        enc.PutWord(words[i]);
    std::vector<int64_t> command_starts = enc.GetCommandStarts();
    check(enc.Close(), "write %s", filename);

    SoundReader reader;
    check(reader.Open(filename), "read %s", filename);
    check(reader.GetSampleRate() == ENCODER_RATE, "sample rate %d", reader.GetSampleRate());

    DecoderOptions options;
    AnnotationList out;
    WaveEdgeSource src(&reader, options);
    check(src.IsOk(), "channel 0 exists");
    SysControlDecoder dec(options, &out);
    check(dec.Decode(&src) == DecodeStatus::Ok, "decode status");
    check(!src.HasError(), "no read error");

    int cnt = 0;
    for (const auto& ann: out.items)
    {
        if (ann.level != ANN_COMMAND || cnt >= N)
            continue;
        check(strcmp(ann.text, lookup_command(words[cnt])) == 0,
              "word %d decoded as %s", cnt, ann.text);
        check(ann.start == command_starts[cnt], "word %d starts at %lld, expected %lld",
              cnt, (long long) ann.start, (long long) command_starts[cnt]);
        cnt++;
    }
    check(cnt == N, "decoded %d of %d words", cnt, N);
    printf("  Decoded %d words\n", cnt);

    // A channel that does not exist
    options.channel = 1;
    WaveEdgeSource bad_channel(&reader, options);
    check(!bad_channel.IsOk(), "channel 1 refused");

    reader.Close();
    check(!reader.IsOpen(), "reader closed");
    if (g_test_ok)
        (void) remove(filename);

    end_test();
}

//----------------------------------------------------------------------------

static void borrowed_sink_test()
{
    begin_test("encoder with caller's sink");

    char filename[200];
    int err = snprintf(filename, sizeof(filename), "/tmp/syscontrol_sink_%d.wav", (int) getpid());
    assert(err >= 0);
    (void) err;

    SoundWriter writer;
    check(writer.Open(filename, 8000), "open %s", filename);

    CommandEncoder enc;
    check(enc.Open(&writer), "encoder accepts sink");
    enc.PutWord(0x1000);
    enc.PutWord(0x1080);
    check(enc.Close(), "encoder close");

    // Encoder flushed everything but left the sink open
    int64_t expected_len = (int64_t) floor(enc.GetDuration()*8000 + 0.5);
    check(writer.GetWritePos() == expected_len, "wrote %lld samples, expected %lld",
          (long long) writer.GetWritePos(), (long long) expected_len);
    short silence[10] = { 0 };
    check(writer.Write(silence, 10), "sink still writable");
    check(writer.GetWritePos() == expected_len + 10, "write position advanced");
    check(writer.Close(), "writer close");

    // First reset starts after the 20 ms idle gap
    check(enc.GetCommandStarts().size() == 2, "two command starts");
    if (enc.GetCommandStarts().size() == 2)
        check(enc.GetCommandStarts()[0] == 160, "first word at 20 ms, got %lld",
              (long long) enc.GetCommandStarts()[0]);

    if (g_test_ok)
        (void) remove(filename);

    end_test();
}

//----------------------------------------------------------------------------

static bool write_file(const char *filename, const std::vector<uint8_t>& bytes)
{
    FILE *f = fopen(filename, "wb");
    if (!f)
        return false;
    bool ok = fwrite(&bytes[0], 1, bytes.size(), f) == bytes.size();
    if (fclose(f) != 0)
        ok = false;
    return ok;
}

static void logic_loopback_test()
{
    begin_test("raw logic loopback");

    const uint16_t words[] = { 0x8045, 0x8044, 0x05bb, 0x0898 };
    const int N = sizeof(words)/sizeof(words[0]);

    std::vector<uint8_t> levels;
    std::vector<int64_t> command_starts;
    for (int i=0; i<N; i++)
        put_word_levels(&levels, words[i], &command_starts);
    levels.insert(levels.end(), T_GAP, 0);

    // Data line on bit 2, the same inverted on bit 3,
    // a clock toggling every sample on bit 0
    std::vector<uint8_t> bytes(levels.size());
    for (size_t i=0; i<levels.size(); i++)
        bytes[i] = (levels[i] << 2) | ((levels[i] ^ 1) << 3) | (i & 1) | 0x80;

    char filename[200];
    int err = snprintf(filename, sizeof(filename), "/tmp/syscontrol_test_%d.bin", (int) getpid());
    assert(err >= 0);
    (void) err;
    check(write_file(filename, bytes), "write %s", filename);

    // Reference: the same levels through an edge list
    EdgeList edges(T_RATE);
    levels_to_edges(levels, &edges);
    AnnotationList expected;
    {
        DecoderOptions options;
        SysControlDecoder dec(options, &expected);
        check(dec.Decode(&edges) == DecodeStatus::Ok, "decode status");
    }
    check(expected.Count(ANN_COMMAND) == N, "reference decode");

    // Without sample rate the raw dump can't be decoded
    {
        DecoderOptions options;
        options.filename = filename;
        options.raw = true;
        options.bit = 2;
        LogicEdgeSource src(options);
        check(src.Open(), "open %s", filename);
        AnnotationList out;
        SysControlDecoder dec(options, &out);
        check(dec.Decode(&src) == DecodeStatus::MissingSampleRate, "missing sample rate");
    }

    // With sample rate
    {
        DecoderOptions options;
        options.filename = filename;
        options.raw = true;
        options.bit = 2;
        options.sample_rate = T_RATE;
        LogicEdgeSource src(options);
        check(src.Open(), "open %s", filename);
        AnnotationList out;
        SysControlDecoder dec(options, &out);
        check(dec.Decode(&src) == DecodeStatus::Ok, "decode status");
        check(!src.HasError(), "no read error");
        check(src.GetPos() == (int64_t) bytes.size(), "all samples examined");
        check(same_annotations(out, expected), "same result as edge list");

        auto commands = texts_at(out, ANN_COMMAND);
        check(commands.size() == 4 &&
              strcmp(commands[0], "CD Play/Pause") == 0 &&
              strcmp(commands[1], "CD Stop") == 0 &&
              strcmp(commands[2], "Tape Stop") == 0 &&
              strcmp(commands[3], "ON3") == 0, "commands");
    }

    // Clip away the first word, positions stay absolute
    {
        DecoderOptions options;
        options.filename = filename;
        options.raw = true;
        options.bit = 2;
        options.sample_rate = T_RATE;
        options.start = (command_starts[1] - 10)/(double) T_RATE;
        options.end = (command_starts[2] - 10)/(double) T_RATE;
        LogicEdgeSource src(options);
        check(src.Open(), "open %s", filename);
        AnnotationList out;
        SysControlDecoder dec(options, &out);
        check(dec.Decode(&src) == DecodeStatus::Ok, "decode status");

        auto commands = texts_at(out, ANN_COMMAND);
        check(commands.size() == 1 && strcmp(commands[0], "CD Stop") == 0, "only second word");
        check(!out.items.empty() && out.items[0].start == command_starts[1],
              "absolute position kept");
    }

    // Inverted copy of the data line
    {
        DecoderOptions options;
        options.filename = filename;
        options.raw = true;
        options.bit = 3;
        options.invert = true;
        options.sample_rate = T_RATE;
        LogicEdgeSource src(options);
        check(src.Open(), "open %s", filename);
        AnnotationList out;
        SysControlDecoder dec(options, &out);
        check(dec.Decode(&src) == DecodeStatus::Ok, "decode status");
        check(same_annotations(out, expected), "inverted line gives same result");
    }

    // Bit 0 carries no valid frames
    {
        DecoderOptions options;
        options.filename = filename;
        options.bit = 0;
        options.sample_rate = T_RATE;
        LogicEdgeSource src(options);
        check(src.Open(), "open %s", filename);
        AnnotationList out;
        SysControlDecoder dec(options, &out);
        check(dec.Decode(&src) == DecodeStatus::Ok, "decode status");
        check(out.items.empty(), "nothing on clock line");
    }

    if (g_test_ok)
        (void) remove(filename);

    end_test();
}

//----------------------------------------------------------------------------
// Schmitt trigger and sampling details
//----------------------------------------------------------------------------

static bool write_wave(const char *filename, const std::vector<float>& samples)
{
    SoundWriter writer;
    if (!writer.Open(filename, T_RATE))
        return false;
    bool ok = writer.Write(&samples[0], (int) samples.size());
    if (!writer.Close())
        ok = false;
    return ok;
}

// Decode channel 0 of a sound file
static bool decode_wave(const char *filename, const DecoderOptions& options, AnnotationList *out)
{
    SoundReader reader;
    if (!reader.Open(filename))
        return false;
    WaveEdgeSource src(&reader, options);
    SysControlDecoder dec(options, out);
    return dec.Decode(&src) == DecodeStatus::Ok && !src.HasError();
}

//----------------------------------------------------------------------------

// Line swings between 0.3 and 0.7 of full scale, as in a DC coupled
// capture of the bus
static void wave_trigger_test()
{
    begin_test("Schmitt trigger");

    const uint16_t words[] = { 0x1000, 0x85fb, 0x1080 };
    const int N = sizeof(words)/sizeof(words[0]);

    std::vector<uint8_t> levels;
    for (int i=0; i<N; i++)
        put_word_levels(&levels, words[i]);
    levels.insert(levels.end(), T_GAP, 0);

    EdgeList edges(T_RATE);
    levels_to_edges(levels, &edges);
    AnnotationList expected;
    {
        DecoderOptions options;
        SysControlDecoder dec(options, &expected);
        check(dec.Decode(&edges) == DecodeStatus::Ok, "decode status");
    }
    check(expected.Count(ANN_COMMAND) == N, "reference decode");

    // Clean signal, the same with glitches 0.04 short of the switch points,
    // and the clean signal inverted
    std::vector<float> clean(levels.size()), glitchy(levels.size()), inverted(levels.size());
    int glitches = 0;
    for (size_t i=0; i<levels.size(); i++)
    {
        clean[i] = levels[i] ? 0.7f : 0.3f;
        inverted[i] = levels[i] ? 0.3f : 0.7f;
        glitchy[i] = clean[i];

        bool steady = i>0 && i+1<levels.size() &&
                      levels[i-1] == levels[i] && levels[i+1] == levels[i];
        if (steady && i%7 == 0)
        {
            glitchy[i] = levels[i] ? 0.46f : 0.54f;
            glitches++;
        }
    }
    check(glitches > 100, "glitches placed");

    char clean_name[200], glitchy_name[200], inverted_name[200];
    (void) snprintf(clean_name, sizeof(clean_name), "/tmp/syscontrol_clean_%d.wav", (int) getpid());
    (void) snprintf(glitchy_name, sizeof(glitchy_name), "/tmp/syscontrol_glitchy_%d.wav", (int) getpid());
    (void) snprintf(inverted_name, sizeof(inverted_name), "/tmp/syscontrol_inverted_%d.wav", (int) getpid());
    check(write_wave(clean_name, clean), "write %s", clean_name);
    check(write_wave(glitchy_name, glitchy), "write %s", glitchy_name);
    check(write_wave(inverted_name, inverted), "write %s", inverted_name);

    // Default threshold at 0 sees the line as constantly high
    {
        DecoderOptions options;
        AnnotationList out;
        check(decode_wave(clean_name, options, &out), "decode %s", clean_name);
        check(out.items.empty(), "nothing below default threshold");
    }

    // Threshold in the middle of the swing
    {
        DecoderOptions options;
        options.threshold = 0.5;
        AnnotationList out;
        check(decode_wave(clean_name, options, &out), "decode %s", clean_name);
        check(same_annotations(out, expected), "clean signal decoded");
    }

    // Hysteresis of 0.1 puts the glitches inside the dead band
    {
        DecoderOptions options;
        options.threshold = 0.5;
        options.hysteresis = 0.1;
        AnnotationList out;
        check(decode_wave(glitchy_name, options, &out), "decode %s", glitchy_name);
        check(same_annotations(out, expected), "glitches rejected");
    }

    // Without hysteresis every glitch is a pair of edges
    {
        DecoderOptions options;
        options.threshold = 0.5;
        options.hysteresis = 0;
        AnnotationList out;
        check(decode_wave(glitchy_name, options, &out), "decode %s", glitchy_name);
        check(!same_annotations(out, expected), "glitches seen without hysteresis");
    }

    // Inverted capture
    {
        DecoderOptions options;
        options.threshold = 0.5;
        options.invert = true;
        AnnotationList out;
        check(decode_wave(inverted_name, options, &out), "decode %s", inverted_name);
        check(same_annotations(out, expected), "inverted signal decoded");
    }

    if (g_test_ok)
    {
        (void) remove(clean_name);
        (void) remove(glitchy_name);
        (void) remove(inverted_name);
    }

    end_test();
}

//----------------------------------------------------------------------------

static void first_sample_test()
{
    begin_test("capture starting high");

    // Line is high for 6 ms from the start of the capture. That is long
    // enough for a reset, but its rising edge was never seen.
    std::vector<uint8_t> levels(60, 1);
    std::vector<int64_t> command_starts;
    put_word_levels(&levels, 0x1080, &command_starts);
    levels.insert(levels.end(), T_GAP, 0);

    char filename[200];
    (void) snprintf(filename, sizeof(filename), "/tmp/syscontrol_high_%d.bin", (int) getpid());
    check(write_file(filename, levels), "write %s", filename);

    DecoderOptions options;
    options.filename = filename;
    options.raw = true;
    options.sample_rate = T_RATE;

    // First edge is where the line drops, not at sample 0
    {
        LogicEdgeSource src(options);
        check(src.Open(), "open %s", filename);
        Edge e;
        check(src.WaitEdge(EDGE_ANY, &e), "an edge");
        check(e.pos == 60 && !e.rising, "first edge falling at 60, got %s at %lld",
              e.rising ? "rising" : "falling", (long long) e.pos);
    }

    {
        LogicEdgeSource src(options);
        check(src.Open(), "open %s", filename);
        AnnotationList out;
        SysControlDecoder dec(options, &out);
        check(dec.Decode(&src) == DecodeStatus::Ok, "decode status");
        check(!out.items.empty() && out.items[0].start == command_starts[0],
              "first annotation is the real reset");
        auto commands = texts_at(out, ANN_COMMAND);
        check(commands.size() == 1 && strcmp(commands[0], "System OFF") == 0, "one command");
    }

    if (g_test_ok)
        (void) remove(filename);

    end_test();
}

//----------------------------------------------------------------------------

static void missing_file_test()
{
    begin_test("missing input file");

    DecoderOptions options;
    options.filename = "/nonexistent/syscontrol_test.bin";
    options.sample_rate = T_RATE;
    LogicEdgeSource src(options);
    check(!src.Open(), "open fails");

    SoundReader reader;
    check(!reader.Open(options.filename, true), "sound open fails");

    options.bit = 8;
    LogicEdgeSource bad_bit(options);
    check(!bad_bit.Open(), "bit 8 refused");

    end_test();
}

//----------------------------------------------------------------------------
// main
//----------------------------------------------------------------------------

// Return test status (0=success)
int main(int, char **)
{
    reset_and_first_bit_test();
    system_on_test();
    ignored_interval_test();
    missing_sample_rate_test();
    timing_window_test();
    no_rising_edge_test();
    custom_timing_test();
    multiple_words_test();
    truncated_word_test();
    session_reset_test();
    random_signal_test();
    hex_text_test();
    command_table_test();
    word_parsing_test();
    printer_test();
    wave_loopback_test();
    borrowed_sink_test();
    logic_loopback_test();
    wave_trigger_test();
    first_sample_test();
    missing_file_test();
    printf("Testing complete\n");
    return 0;
}
