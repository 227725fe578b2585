#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <map>
#include <string>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "kb_sender.h"
#include "temp_dir.h"

using kb_sender::NewlineMode;
using kb_sender::Options;

namespace {

settings::EnvLookup no_env() {
    return [](const char*) -> const char* { return nullptr; };
}

bool parse(std::vector<std::string> args, Options& opts, std::string& error) {
    if (!kb_sender::default_options(opts, error, no_env())) return false;
    args.insert(args.begin(), "bt_kb_send");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return kb_sender::parse_args(static_cast<int>(args.size()), argv.data(), opts, error);
}

} // namespace

TEST(KbSender, Defaults) {
    Options opts;
    std::string error;
    ASSERT_TRUE(kb_sender::default_options(opts, error, no_env()));
    EXPECT_EQ(opts.wait_secs, 10u);
    EXPECT_TRUE(opts.wait_ready);
    EXPECT_EQ(opts.newline_mode, NewlineMode::CR);

    ASSERT_TRUE(kb_sender::default_options(opts, error, [](const char* name) -> const char* {
        return std::string(name) == "BT_KB_WAIT_SECS" ? "3" : nullptr;
    }));
    EXPECT_EQ(opts.wait_secs, 3u);
}

TEST(KbSender, ParsesOptionsAndText) {
    Options opts;
    std::string error;
    ASSERT_TRUE(parse({"--nowait", "--wait", "2", "--newline-mode", "strip", "hello", "world"}, opts, error))
        << error;
    EXPECT_FALSE(opts.wait_ready);
    EXPECT_EQ(opts.wait_secs, 2u);
    EXPECT_EQ(opts.newline_mode, NewlineMode::STRIP);
    EXPECT_EQ(opts.text, "hello world");
}

TEST(KbSender, MalformedArguments) {
    Options opts;
    std::string error;
    EXPECT_FALSE(parse({}, opts, error));
    EXPECT_FALSE(parse({"--wait", "soon", "x"}, opts, error));
    EXPECT_FALSE(parse({"--newline-mode", "lf", "x"}, opts, error));
    EXPECT_FALSE(parse({"--frobnicate", "x"}, opts, error));
    EXPECT_FALSE(parse({"--file", "/tmp/a", "x"}, opts, error));
}

TEST(KbSender, NewlineModes) {
    EXPECT_EQ(kb_sender::apply_newline_mode("a\nb\n", NewlineMode::PRESERVE), "a\nb\n");
    EXPECT_EQ(kb_sender::apply_newline_mode("a\nb\n", NewlineMode::CR), "a\rb\r");
    EXPECT_EQ(kb_sender::apply_newline_mode("a\nb\n", NewlineMode::STRIP), "ab");
}

TEST(KbSender, LoadPayloadFromFile) {
    TempDir dir;
    ASSERT_TRUE(dir.ok());
    std::string path = dir.file("in.txt");
    FILE* f = fopen(path.c_str(), "w");
    ASSERT_NE(f, nullptr);
    fputs("line 1\nline 2\n", f);
    fclose(f);

    Options opts;
    std::string error;
    ASSERT_TRUE(parse({"--file", path}, opts, error));
    std::string payload;
    ASSERT_TRUE(kb_sender::load_payload(opts, payload, error));
    EXPECT_EQ(payload, "line 1\nline 2\n");

    opts.file = dir.file("missing.txt");
    EXPECT_FALSE(kb_sender::load_payload(opts, payload, error));
}

TEST(KbSender, MissingFifoTimesOut) {
    TempDir dir;
    ASSERT_TRUE(dir.ok());
    Options opts;
    std::string error;
    ASSERT_TRUE(parse({"--wait", "0", "--fifo", dir.file("fifo"), "x"}, opts, error));
    EXPECT_EQ(kb_sender::send(opts, "x"), kb_sender::EXIT_NOT_READY);
}

TEST(KbSender, NoSubscribedHostTimesOut) {
    TempDir dir;
    ASSERT_TRUE(dir.ok());
    ASSERT_EQ(mkfifo(dir.file("fifo").c_str(), 0666), 0);

    Options opts;
    std::string error;
    ASSERT_TRUE(parse({"--wait", "0", "--fifo", dir.file("fifo"),
                       "--ready-flag", dir.file("notifying"), "x"}, opts, error));
    EXPECT_EQ(kb_sender::send(opts, "x"), kb_sender::EXIT_NOT_READY);
}

TEST(KbSender, NoReaderFails) {
    TempDir dir;
    ASSERT_TRUE(dir.ok());
    ASSERT_EQ(mkfifo(dir.file("fifo").c_str(), 0666), 0);

    Options opts;
    std::string error;
    ASSERT_TRUE(parse({"--nowait", "--wait", "0", "--fifo", dir.file("fifo"), "x"}, opts, error));
    EXPECT_EQ(kb_sender::send(opts, "x"), kb_sender::EXIT_NOT_READY);
}

TEST(KbSender, WritesToReadyFifo) {
    TempDir dir;
    ASSERT_TRUE(dir.ok());
    std::string fifo = dir.file("fifo");
    std::string flag = dir.file("notifying");
    ASSERT_EQ(mkfifo(fifo.c_str(), 0666), 0);
    FILE* f = fopen(flag.c_str(), "w");
    ASSERT_NE(f, nullptr);
    fclose(f);

    int reader = ::open(fifo.c_str(), O_RDONLY | O_NONBLOCK);
    ASSERT_GE(reader, 0);

    Options opts;
    std::string error;
    ASSERT_TRUE(parse({"--wait", "1", "--fifo", fifo, "--ready-flag", flag, "x"}, opts, error));
    EXPECT_EQ(kb_sender::send(opts, "hej\nmed\n"), kb_sender::EXIT_SENT);

    char buf[32];
    ssize_t n = read(reader, buf, sizeof(buf));
    close(reader);
    ASSERT_EQ(n, 8);
    EXPECT_EQ(std::string(buf, 8), "hej\rmed\r");
}

TEST(KbSender, ReaderClosingMidWriteFails) {
    TempDir dir;
    ASSERT_TRUE(dir.ok());
    std::string fifo = dir.file("fifo");
    ASSERT_EQ(mkfifo(fifo.c_str(), 0666), 0);

    int reader = ::open(fifo.c_str(), O_RDONLY | O_NONBLOCK);
    ASSERT_GE(reader, 0);
    // Larger than the pipe buffer, so the write blocks until the reader goes.
    std::thread closer([reader] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        close(reader);
    });

    Options opts;
    std::string error;
    ASSERT_TRUE(parse({"--nowait", "--wait", "0", "--fifo", fifo, "x"}, opts, error));
    int rc = kb_sender::send(opts, std::string(1 << 20, 'a'));
    closer.join();
    EXPECT_EQ(rc, kb_sender::EXIT_NOT_READY);
}
