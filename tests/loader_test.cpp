#include "json_pager_loader.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

class TempFile
{
public:
    const std::string FilePath;

    static TempFile *Create(const std::string &contents)
    {
        char path[] = "/tmp/json-pager-test.XXXXXX";
        int fd = mkstemp(path);
        EXPECT_GT(fd, 1);
        FILE *f = fdopen(fd, "w");
        EXPECT_NE(f, nullptr);
        EXPECT_EQ(fwrite(contents.data(), 1, contents.size(), f), contents.size());
        EXPECT_EQ(fclose(f), 0);
        return new TempFile(path);
    }

    ~TempFile() { EXPECT_EQ(unlink(FilePath.c_str()), 0); }

private:
    explicit TempFile(const std::string &path) : FilePath(path) {}
    TempFile(const TempFile &other);
};

// A FIFO in a private directory, for input that arrives while the loader
// is running.
class Fifo
{
public:
    Fifo()
    {
        char pattern[] = "/tmp/json-pager-fifo.XXXXXX";
        EXPECT_NE(mkdtemp(pattern), nullptr);
        dir = pattern;
        path = dir + "/input";
        EXPECT_EQ(mkfifo(path.c_str(), 0600), 0);
    }

    ~Fifo()
    {
        if (writer >= 0)
            close(writer);
        EXPECT_EQ(unlink(path.c_str()), 0);
        EXPECT_EQ(rmdir(dir.c_str()), 0);
    }

    // Blocks until the loader has opened the other end.
    void openWriter() { writer = open(path.c_str(), O_WRONLY); }

    void send(const std::string &data)
    {
        EXPECT_EQ(write(writer, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void closeWriter()
    {
        close(writer);
        writer = -1;
    }

    std::string path;
    int writer = -1;

private:
    std::string dir;
};

// Polls until `done` holds or a few seconds have passed.
template <typename Predicate>
static void pollUntil(DocumentLoader &loader, ValueTree &tree, Predicate done)
{
    for (int i = 0; i < 500 && !done(); ++i)
    {
        loader.poll(tree);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

static std::string manyLines(int count)
{
    std::string s;
    for (int i = 0; i < count; ++i)
        s += "{\"i\":" + std::to_string(i) + "}\n";
    return s;
}

TEST(LoaderTest, LoadsFromMemory)
{
    DocumentLoader loader;
    ValueTree tree;
    loader.startWithContents(R"({"a":[1,2,3]})", ParseOptions());
    loader.wait();
    EXPECT_EQ(loader.state(), LoadState::Done);
    EXPECT_TRUE(loader.poll(tree));
    EXPECT_EQ(tree.size(), 6u);
    EXPECT_FALSE(tree.growing());
    EXPECT_TRUE(tree.node(1).complete);
    EXPECT_EQ(tree.visibleLineCount(), 7u);
    EXPECT_EQ(loader.progress().nodes, 5u);
    // Nothing new to apply.
    EXPECT_FALSE(loader.poll(tree));
}

TEST(LoaderTest, LoadsInBatches)
{
    ParseOptions options;
    options.mode = InputMode::LineDelimited;
    DocumentLoader loader;
    ValueTree tree;
    loader.startWithContents(manyLines(10000), options);
    loader.wait();
    loader.poll(tree);
    EXPECT_TRUE(tree.lineDelimited());
    EXPECT_EQ(tree.topLevelCount(), 10000u);
    EXPECT_EQ(tree.size(), 20001u);
    EXPECT_EQ(tree.node(20000).text, "9999");
    EXPECT_EQ(loader.progress().nodes, 20000u);
}

TEST(LoaderTest, InitialDepthApplies)
{
    ParseOptions options;
    options.initialDepth = 0;
    DocumentLoader loader;
    ValueTree tree;
    loader.startWithContents(R"({"a":{"b":1}})", options);
    loader.wait();
    loader.poll(tree);
    EXPECT_EQ(tree.visibleLineCount(), 1u);
}

TEST(LoaderTest, ParseErrorKeepsPartialTree)
{
    DocumentLoader loader;
    ValueTree tree;
    loader.startWithContents("[1,2,\n", ParseOptions());
    loader.wait();
    loader.poll(tree);
    EXPECT_EQ(loader.state(), LoadState::Failed);
    EXPECT_NE(loader.error().find("Parse error at line"), std::string::npos);
    ASSERT_EQ(tree.size(), 4u);
    EXPECT_FALSE(tree.node(1).complete);
    EXPECT_FALSE(tree.growing());
}

TEST(LoaderTest, MissingFileFails)
{
    DocumentLoader loader;
    ValueTree tree;
    loader.start("/nonexistent/json-pager/input.json", ParseOptions());
    loader.wait();
    loader.poll(tree);
    EXPECT_EQ(loader.state(), LoadState::Failed);
    EXPECT_NE(loader.error().find("/nonexistent/json-pager/input.json"), std::string::npos);
    EXPECT_TRUE(tree.empty());
}

TEST(LoaderTest, LoadsFromFile)
{
    const std::string contents = R"({"file":true})";
    std::unique_ptr<TempFile> file(TempFile::Create(contents));
    DocumentLoader loader;
    ValueTree tree;
    loader.start(file->FilePath, ParseOptions());
    loader.wait();
    loader.poll(tree);
    EXPECT_EQ(loader.state(), LoadState::Done);
    EXPECT_EQ(loader.progress().bytesRead, contents.size());
    EXPECT_EQ(loader.progress().totalBytes, contents.size());
    ASSERT_EQ(tree.size(), 3u);
    EXPECT_EQ(tree.node(2).key, "file");
}

TEST(LoaderTest, CancelStopsTheWorker)
{
    ParseOptions options;
    options.mode = InputMode::LineDelimited;
    DocumentLoader loader;
    ValueTree tree;
    loader.startWithContents(manyLines(200000), options);
    loader.cancel();
    LoadState state = loader.state();
    EXPECT_TRUE(state == LoadState::Cancelled || state == LoadState::Done);
    loader.poll(tree);
    EXPECT_FALSE(tree.growing());
}

TEST(LoaderTest, NewLoadReplacesTheOldOne)
{
    DocumentLoader loader;
    ValueTree tree;
    loader.startWithContents("[1,2,3]", ParseOptions());
    loader.wait();
    loader.poll(tree);
    ASSERT_EQ(tree.size(), 5u);

    ParseOptions options;
    options.mode = InputMode::LineDelimited;
    loader.startWithContents("{\"x\":1}\n{\"y\":2}\n", options);
    loader.wait();
    EXPECT_TRUE(loader.poll(tree));
    EXPECT_EQ(tree.topLevelCount(), 2u);
    EXPECT_EQ(tree.size(), 5u);
    EXPECT_TRUE(tree.lineDelimited());
    EXPECT_EQ(tree.node(2).key, "x");
}

TEST(LoaderTest, ShowsLinesFromAPipeBeforeItEnds)
{
    Fifo fifo;
    ParseOptions options;
    options.mode = InputMode::LineDelimited;
    DocumentLoader loader;
    ValueTree tree;
    loader.start(fifo.path, options);
    fifo.openWriter();
    ASSERT_GE(fifo.writer, 0);

    const std::string lines = "{\"x\":1}\n{\"y\":2}\n";
    fifo.send(lines);
    pollUntil(loader, tree, [&tree] { return tree.topLevelCount() == 2; });
    EXPECT_EQ(tree.topLevelCount(), 2u);
    EXPECT_TRUE(tree.growing());
    EXPECT_EQ(loader.state(), LoadState::Reading);
    EXPECT_EQ(loader.progress().bytesRead, lines.size());

    // A line without its newline is not parsed yet.
    fifo.send("{\"z\"");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    loader.poll(tree);
    EXPECT_EQ(tree.topLevelCount(), 2u);

    // The writer is still connected, so nothing ends the read but the cancel.
    auto started = std::chrono::steady_clock::now();
    loader.cancel();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_EQ(loader.state(), LoadState::Cancelled);
    loader.poll(tree);
    EXPECT_FALSE(tree.growing());
    EXPECT_EQ(tree.topLevelCount(), 2u);
}

TEST(LoaderTest, ShowsAPartialDocumentFromAPipe)
{
    Fifo fifo;
    DocumentLoader loader;
    ValueTree tree;
    loader.start(fifo.path, ParseOptions());
    fifo.openWriter();
    ASSERT_GE(fifo.writer, 0);

    // The lexer needs the comma to finish the 2.
    fifo.send("[1,\n2,");
    pollUntil(loader, tree, [&tree] { return tree.size() == 4; });
    ASSERT_EQ(tree.size(), 4u);
    EXPECT_FALSE(tree.node(1).complete);
    EXPECT_EQ(tree.node(3).text, "2");

    fifo.send("-0]\n");
    fifo.closeWriter();
    loader.wait();
    loader.poll(tree);
    EXPECT_EQ(loader.state(), LoadState::Done);
    ASSERT_EQ(tree.size(), 5u);
    EXPECT_EQ(tree.node(4).text, "-0");
    EXPECT_TRUE(tree.node(1).complete);
    EXPECT_FALSE(tree.growing());
}

TEST(LoaderTest, QuittingBeforeTheWriterConnects)
{
    Fifo fifo;
    DocumentLoader loader;
    ValueTree tree;
    loader.start(fifo.path, ParseOptions());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto started = std::chrono::steady_clock::now();
    loader.cancel();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_EQ(loader.state(), LoadState::Cancelled);
    loader.poll(tree);
    EXPECT_TRUE(tree.empty());
}
