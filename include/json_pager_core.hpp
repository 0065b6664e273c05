#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

// Input file could not be opened or read.
class IoError : public std::runtime_error
{
public:
    explicit IoError(const std::string &message) : std::runtime_error(message) {}
};

constexpr const char *kVersion = "1.0.0";

int getDisplayWidth(const std::string &str);
// Longest prefix of `str` that fits in `maxWidth` columns.  Never splits a
// UTF-8 sequence, even when the locale cannot decode it.
std::string truncateToWidth(const std::string &str, int maxWidth);
std::string shortenPath(const std::string &path, int maxWidth);
std::string formatFileSize(std::size_t size);

// Size of a regular file, or 0 when it is unknown (stdin, pipes).
std::size_t inputSize(const std::string &path);

// Reads a file, or stdin when the path is "-", in chunks as data arrives.
// Pipes and FIFOs are polled, so a reader waiting for a writer can be told
// to give up.
class InputReader
{
public:
    static constexpr std::size_t kChunkSize = 64 * 1024;
    static constexpr int kPollMillis = 100;

    // Throws IoError if the input cannot be opened.
    explicit InputReader(const std::string &path);
    ~InputReader();

    InputReader(const InputReader &) = delete;
    InputReader &operator=(const InputReader &) = delete;

    // Replaces `chunk` with the next piece of input.  While no data is
    // available `keepWaiting` is asked every kPollMillis whether to go on.
    // Returns false at end of input or when waiting was given up.  Throws
    // IoError on a read error.
    bool read(std::string &chunk, const std::function<bool()> &keepWaiting);

    std::size_t bytesRead() const { return total; }

private:
    std::string name;
    int fd = -1;
    bool ownsFd = false;
    std::size_t total = 0;
};

bool osc52Likely();
std::string getClipboardStatusMessage(const std::string &what);
// Sends `text` to the terminal clipboard with OSC 52.  Returns false when the
// terminal is unlikely to support it or the payload is too large.
bool copyToClipboard(const std::string &text);

// Logging is off unless a log file is given.  Unknown level names fall back
// to "info".
void setupLogging(const std::string &logFile, const std::string &level);
