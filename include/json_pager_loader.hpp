#pragma once

#include "json_pager_parser.hpp"
#include "json_pager_tree.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class LoadState
{
    Idle,
    Reading, // parsing as the input arrives
    Parsing, // parsing contents already in memory
    Done,
    Failed,
    Cancelled
};

struct LoadProgress
{
    std::size_t bytesRead = 0;
    std::size_t totalBytes = 0; // 0 when unknown
    std::size_t nodes = 0;
};

// Reads and parses a document on a worker thread.  The worker never touches
// the tree: it publishes batches of nodes which the control loop applies
// with poll().  A batch goes out when it is full or when the worker is about
// to wait for more input, so a document arriving through a pipe is shown as
// it comes in.  Starting another load cancels and joins the current one and
// discards whatever it had not delivered yet.
class DocumentLoader
{
public:
    static constexpr std::size_t kBatchSize = 4096;

    DocumentLoader() = default;
    ~DocumentLoader();

    DocumentLoader(const DocumentLoader &) = delete;
    DocumentLoader &operator=(const DocumentLoader &) = delete;

    // `path` is a file name or "-" for stdin.
    void start(const std::string &path, const ParseOptions &options);
    void startWithContents(std::string contents, const ParseOptions &options);

    // Requests cancellation and waits for the worker to stop.
    void cancel();
    // Waits for the worker to finish on its own.
    void wait();

    // Applies everything published since the last call.  The first poll of a
    // new load resets the tree.  Returns true if the tree changed.
    bool poll(ValueTree &tree);

    LoadState state() const;
    LoadProgress progress() const;
    // Failure description, empty unless state() is Failed.
    std::string error() const;

private:
    struct Delta
    {
        std::vector<Node> nodes;
        std::vector<NodeIndex> completed;
    };

    class DeltaSink;

    std::thread worker;
    std::atomic<bool> cancelRequested{false};

    mutable std::mutex mutex;
    std::deque<Delta> deltas;
    std::uint64_t generation = 0;
    std::uint64_t appliedGeneration = 0;
    LoadState currentState = LoadState::Idle;
    LoadProgress currentProgress;
    std::string errorText;
    bool lineDelimited = false;

    void launch(const std::string &path, std::string contents, bool fromContents, const ParseOptions &options);
    void run(std::uint64_t gen, std::string path, std::string contents, bool fromContents, ParseOptions options);
    void publish(std::uint64_t gen, Delta delta, std::size_t nodeCount);
    void setState(std::uint64_t gen, LoadState state, const std::string &message = std::string());
    void setBytesRead(std::uint64_t gen, std::size_t bytes);
};
