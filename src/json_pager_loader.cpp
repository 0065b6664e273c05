// Background reading and parsing with cooperative cancellation
#include "json_pager_loader.hpp"

#include "json_pager_core.hpp"

#include <spdlog/spdlog.h>

#include <utility>

// Collects parser output into deltas.  Indices are assigned as the tree
// will assign them: the document root is 0 and the load starts from an
// empty tree.
class DocumentLoader::DeltaSink : public NodeSink
{
public:
    DeltaSink(DocumentLoader &loader, std::uint64_t gen) : loader(loader), gen(gen) {}

    NodeIndex append(Node node) override
    {
        batch.nodes.push_back(std::move(node));
        NodeIndex index = nextIndex++;
        if (batch.nodes.size() >= kBatchSize)
            flush();
        return index;
    }

    void complete(NodeIndex index) override { batch.completed.push_back(index); }

    bool keepGoing() override { return !loader.cancelRequested.load(std::memory_order_relaxed); }

    void flush()
    {
        if (batch.nodes.empty() && batch.completed.empty())
            return;
        loader.publish(gen, std::move(batch), nextIndex - 1);
        batch = Delta();
    }

private:
    DocumentLoader &loader;
    std::uint64_t gen;
    Delta batch;
    NodeIndex nextIndex = 1;
};

DocumentLoader::~DocumentLoader()
{
    cancel();
}

void DocumentLoader::start(const std::string &path, const ParseOptions &options)
{
    launch(path, std::string(), false, options);
}

void DocumentLoader::startWithContents(std::string contents, const ParseOptions &options)
{
    launch("-", std::move(contents), true, options);
}

void DocumentLoader::launch(const std::string &path, std::string contents, bool fromContents,
                            const ParseOptions &options)
{
    cancel();

    std::uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        gen = ++generation;
        deltas.clear();
        currentState = LoadState::Reading;
        currentProgress = LoadProgress();
        currentProgress.totalBytes = fromContents ? contents.size() : inputSize(path);
        errorText.clear();
        lineDelimited = options.mode == InputMode::LineDelimited;
    }
    cancelRequested = false;
    spdlog::debug("loading {} (generation {})", fromContents ? "<memory>" : path, gen);
    worker = std::thread(&DocumentLoader::run, this, gen, path, std::move(contents), fromContents, options);
}

void DocumentLoader::cancel()
{
    cancelRequested = true;
    if (worker.joinable())
        worker.join();
}

void DocumentLoader::wait()
{
    if (worker.joinable())
        worker.join();
}

void DocumentLoader::run(std::uint64_t gen, std::string path, std::string contents, bool fromContents,
                         ParseOptions options)
{
    DeltaSink sink(*this, gen);
    try
    {
        bool finished = false;
        if (fromContents)
        {
            setBytesRead(gen, contents.size());
            setState(gen, LoadState::Parsing);
            finished = parseToSink(contents, options, sink);
        }
        else
        {
            InputReader reader(path);
            auto keepWaiting = [this] { return !cancelRequested.load(std::memory_order_relaxed); };
            finished = parseStream(
                [&](std::string &chunk) {
                    // Whatever the last chunk produced is shown while the
                    // next one is awaited.
                    sink.flush();
                    if (!keepWaiting() || !reader.read(chunk, keepWaiting))
                        return false;
                    setBytesRead(gen, reader.bytesRead());
                    return true;
                },
                options, sink);
        }
        sink.flush();
        setState(gen, finished ? LoadState::Done : LoadState::Cancelled);
    }
    catch (const ParseError &ex)
    {
        // Keep what was parsed before the error.
        sink.flush();
        spdlog::error("parse error: {}", ex.what());
        setState(gen, LoadState::Failed, std::string("Parse error at ") + ex.what());
    }
    catch (const std::exception &ex)
    {
        sink.flush();
        spdlog::error("load failed: {}", ex.what());
        setState(gen, LoadState::Failed, ex.what());
    }
}

void DocumentLoader::publish(std::uint64_t gen, Delta delta, std::size_t nodeCount)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (gen != generation)
        return;
    deltas.push_back(std::move(delta));
    currentProgress.nodes = nodeCount;
}

void DocumentLoader::setState(std::uint64_t gen, LoadState state, const std::string &message)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (gen != generation)
        return;
    currentState = state;
    errorText = message;
    if (state == LoadState::Done)
        spdlog::info("loaded {} nodes from {} bytes", currentProgress.nodes, currentProgress.bytesRead);
}

void DocumentLoader::setBytesRead(std::uint64_t gen, std::size_t bytes)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (gen == generation)
        currentProgress.bytesRead = bytes;
}

bool DocumentLoader::poll(ValueTree &tree)
{
    std::deque<Delta> ready;
    bool resetTree = false;
    bool stillLoading = false;
    bool delimited = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (appliedGeneration != generation)
        {
            appliedGeneration = generation;
            resetTree = true;
        }
        ready.swap(deltas);
        stillLoading = currentState == LoadState::Reading || currentState == LoadState::Parsing;
        delimited = lineDelimited;
    }

    bool changed = false;
    if (resetTree)
    {
        tree.reset();
        tree.setLineDelimited(delimited);
        changed = true;
    }
    for (Delta &delta : ready)
    {
        for (Node &node : delta.nodes)
            tree.appendNode(std::move(node));
        for (NodeIndex index : delta.completed)
            tree.markComplete(index);
        changed = true;
    }
    if (tree.growing() != stillLoading)
    {
        tree.setGrowing(stillLoading);
        changed = true;
    }
    return changed;
}

LoadState DocumentLoader::state() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return currentState;
}

LoadProgress DocumentLoader::progress() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return currentProgress;
}

std::string DocumentLoader::error() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return errorText;
}
