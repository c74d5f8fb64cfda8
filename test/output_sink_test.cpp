// =============================================================================
// output_sink_test.cpp — bounded output buffer and transcript spill
// =============================================================================

#include "harness.hpp"
#include "logging/logger.hpp"
#include "output/output_sink.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

static std::string MakeTempDir()
{
    char tmpl[] = "/tmp/ptyrun_test_XXXXXX";
    const char *dir = ::mkdtemp(tmpl);
    if (dir == nullptr)
        throw std::runtime_error("mkdtemp failed");
    return dir;
}

static std::string ReadFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void testBuffer()
{
    std::cout << "\n--- Buffering ---\n";

    runTest("small output is kept whole", []()
            {
        output::OutputSink sink(output::SinkOptions{});
        sink.Push("hello\n");
        sink.Push("world");
        auto s = sink.Dump();
        XASSERT_EQ(s.output, std::string("hello\nworld"));
        XASSERT(!s.truncated);
        XASSERT_EQ(s.total_bytes, 11u);
        XASSERT_EQ(s.total_lines, 1u);
        XASSERT(!s.transcript_path.has_value()); });

    runTest("oldest chunks are dropped past max_buffer", []()
            {
        output::SinkOptions opt;
        opt.max_buffer = 12;
        output::OutputSink sink(opt);
        for (int i = 0; i < 5; ++i)
            sink.Push("line" + std::to_string(i) + "\n");
        auto s = sink.Dump();
        XASSERT(s.truncated);
        XASSERT_EQ(s.output, std::string("line3\nline4\n"));
        XASSERT_EQ(s.total_bytes, 30u);
        XASSERT_EQ(s.total_lines, 5u); });

    runTest("a single oversized chunk is still kept", []()
            {
        output::SinkOptions opt;
        opt.max_buffer = 4;
        output::OutputSink sink(opt);
        sink.Push("0123456789");
        auto s = sink.Dump();
        XASSERT_EQ(s.output, std::string("0123456789"));
        XASSERT(!s.truncated); });

    runTest("annotation is appended after a blank line", []()
            {
        output::OutputSink sink(output::SinkOptions{});
        sink.Push("out");
        XASSERT_EQ(sink.Dump("Command timed out").output,
                   std::string("out\n\nCommand timed out")); });

    runTest("every chunk reaches on_chunk in order", []()
            {
        std::vector<std::string> seen;
        output::SinkOptions opt;
        opt.max_buffer = 1;
        opt.on_chunk = [&](const std::string &t) { seen.push_back(t); };
        output::OutputSink sink(opt);
        sink.Push("a");
        sink.Push("");
        sink.Push("b");
        sink.Push("c");
        XASSERT_EQ(seen.size(), 3u);
        XASSERT_EQ(seen[0] + seen[1] + seen[2], std::string("abc")); });
}

static void testSpill()
{
    std::cout << "\n--- Transcript spill ---\n";

    runTest("transcript logger writes everything appended", []()
            {
        const std::string dir = MakeTempDir();
        const std::string path = dir + "/direct.log";
        {
            logging::TranscriptLogger logger(path);
            XASSERT(logger.OpenOk());
            logger.Start();
            for (int i = 0; i < 1000; ++i)
                logger.Append("row " + std::to_string(i) + "\n");
            logger.Join();
        }
        const std::string text = ReadFile(path);
        XASSERT(text.rfind("row 0\n", 0) == 0);
        XASSERT(text.find("row 999\n") != std::string::npos);
        XASSERT_EQ(static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')), 1000u);
        ::unlink(path.c_str());
        ::rmdir(dir.c_str()); });

    runTest("crossing the threshold spills the full stream", []()
            {
        const std::string dir = MakeTempDir();
        output::SinkOptions opt;
        opt.spill_threshold = 8;
        opt.max_buffer = 8;
        opt.transcript_dir = dir;
        output::OutputSink sink(opt);
        sink.Push("hello\n");
        sink.Push("world\n");
        sink.Push("!\n");
        auto s = sink.Dump();
        XASSERT(s.transcript_path.has_value());
        XASSERT(s.transcript_path->rfind(dir + "/ptyrun_", 0) == 0);
        XASSERT_EQ(ReadFile(*s.transcript_path), std::string("hello\nworld\n!\n"));
        XASSERT(s.truncated);
        XASSERT_EQ(s.output, std::string("world\n!\n"));
        ::unlink(s.transcript_path->c_str());
        ::rmdir(dir.c_str()); });

    runTest("unwritable transcript dir keeps the in-memory buffer", []()
            {
        output::SinkOptions opt;
        opt.spill_threshold = 1;
        opt.transcript_dir = "/nonexistent/ptyrun";
        output::OutputSink sink(opt);
        sink.Push("abc");
        sink.Push("def");
        auto s = sink.Dump();
        XASSERT(!s.transcript_path.has_value());
        XASSERT_EQ(s.output, std::string("abcdef")); });
}

int main()
{
    banner("Output Sink Tests");

    testBuffer();
    testSpill();

    return finish();
}
