// Helpers shared by the pager core and the terminal frontend
#include "json_pager_core.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cwchar>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>
#include <wchar.h>

// Calculate the display width of a UTF-8 string (handles Unicode properly)
int getDisplayWidth(const std::string &str)
{
    std::vector<wchar_t> wstr(str.length() + 1);
    size_t result = mbstowcs(wstr.data(), str.c_str(), str.length());
    if (result == static_cast<size_t>(-1))
    {
        // Conversion failed, fall back to byte length
        return static_cast<int>(str.length());
    }
    wstr[result] = L'\0';

    // wcswidth returns -1 for unprintable characters, fall back to byte length
    int width = wcswidth(wstr.data(), result);
    return (width >= 0) ? width : static_cast<int>(str.length());
}

std::string truncateToWidth(const std::string &str, int maxWidth)
{
    int width = 0;
    size_t i = 0;
    while (i < str.size())
    {
        // Sequence boundaries come from the bytes; the locale only decides the width
        size_t len = 1;
        while (i + len < str.size() && (static_cast<unsigned char>(str[i + len]) & 0xC0) == 0x80)
            ++len;

        int charWidth = 1;
        std::mbstate_t state = std::mbstate_t();
        wchar_t wc = 0;
        if (mbrtowc(&wc, str.data() + i, len, &state) == len)
            charWidth = std::max(wcwidth(wc), 0);
        if (width + charWidth > maxWidth)
            break;
        width += charWidth;
        i += len;
    }
    return str.substr(0, i);
}

// Shorten a file path to fit within maxWidth by replacing middle parts with "..."
std::string shortenPath(const std::string &path, int maxWidth)
{
    if (getDisplayWidth(path) <= maxWidth)
    {
        return path;
    }
    if (maxWidth < 8)
    {
        return path.substr(0, static_cast<size_t>(std::max(maxWidth, 0)));
    }

    size_t lastSlash = path.find_last_of('/');
    if (lastSlash == std::string::npos)
    {
        return path.substr(0, maxWidth - 3) + "...";
    }

    std::string filename = path.substr(lastSlash + 1);
    std::string directory = path.substr(0, lastSlash);

    if (getDisplayWidth(filename) > maxWidth - 4)
    { // -4 for ".../"
        return ".../" + filename.substr(0, maxWidth - 7) + "...";
    }

    int remainingSpace = maxWidth - getDisplayWidth(filename) - 1; // -1 for the slash

    // Keep start and end of the directory, replace the middle with "..."
    int prefixLen = std::max(1, remainingSpace / 3);
    int suffixLen = std::max(1, remainingSpace - prefixLen - 3);
    if (prefixLen + suffixLen + 3 >= getDisplayWidth(directory))
    {
        return path;
    }

    std::string prefix = directory.substr(0, prefixLen);
    std::string suffix = directory.substr(directory.length() - suffixLen);
    return prefix + "..." + suffix + "/" + filename;
}

// Format file size in human-readable units
std::string formatFileSize(size_t size)
{
    const char *units[] = {"Bytes", "KB", "MB", "GB", "TB"};
    const size_t unitCount = sizeof(units) / sizeof(units[0]);

    double fileSize = static_cast<double>(size);
    size_t unitIndex = 0;
    while (fileSize >= 1024.0 && unitIndex < unitCount - 1)
    {
        fileSize /= 1024.0;
        unitIndex++;
    }

    std::ostringstream oss;
    if (unitIndex == 0)
    {
        oss << static_cast<size_t>(fileSize) << " " << units[unitIndex];
    }
    else if (fileSize < 10.0)
    {
        oss.precision(1);
        oss << std::fixed << fileSize << " " << units[unitIndex];
    }
    else
    {
        oss << static_cast<int>(fileSize + 0.5) << " " << units[unitIndex];
    }
    return oss.str();
}

size_t inputSize(const std::string &path)
{
    if (path == "-")
        return 0;
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return 0;
    return static_cast<size_t>(st.st_size);
}

InputReader::InputReader(const std::string &path) : name(path == "-" ? "stdin" : path)
{
    if (path == "-")
    {
        // Shared with the rest of the process, so its flags stay as they are.
        fd = STDIN_FILENO;
        return;
    }

    struct stat st;
    if (stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
        throw IoError(path + " is a directory");

    // Non-blocking so that opening a FIFO does not wait for its writer.
    fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
        throw IoError("Failed to open file: " + path + " (" + std::strerror(errno) + ")");
    ownsFd = true;
}

InputReader::~InputReader()
{
    if (ownsFd)
        close(fd);
}

bool InputReader::read(std::string &chunk, const std::function<bool()> &keepWaiting)
{
    chunk.resize(kChunkSize);
    while (true)
    {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, kPollMillis);
        if (ready < 0 && errno != EINTR)
            throw IoError("Failed to read " + name + " (" + std::strerror(errno) + ")");
        if (ready <= 0)
        {
            if (keepWaiting && !keepWaiting())
                break;
            continue;
        }

        ssize_t got = ::read(fd, &chunk[0], chunk.size());
        if (got > 0)
        {
            chunk.resize(static_cast<size_t>(got));
            total += static_cast<size_t>(got);
            return true;
        }
        if (got == 0)
            break;
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
            throw IoError("Failed to read " + name + " (" + std::strerror(errno) + ")");
        if (keepWaiting && !keepWaiting())
            break;
    }
    chunk.clear();
    return false;
}

// Base64 encoding for OSC 52 clipboard support
static std::string base64Encode(const std::string &input)
{
    static const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    std::string encoded;
    encoded.reserve((input.size() + 2) / 3 * 4);
    int val = 0, valb = -6;
    for (unsigned char c : input)
    {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0)
        {
            encoded.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6)
        encoded.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (encoded.size() % 4)
        encoded.push_back('=');
    return encoded;
}

// Check if OSC 52 clipboard sequences are likely to be supported
bool osc52Likely()
{
    const char *noOsc52 = std::getenv("NO_OSC52");
    if (noOsc52 && *noOsc52)
        return false;

    const char *term = std::getenv("TERM");
    if (!term)
        return false;

    std::string termStr(term);
    if (termStr == "dumb" || termStr == "linux")
        return false;

    return termStr.find("xterm") != std::string::npos ||
           termStr.find("tmux") != std::string::npos ||
           termStr.find("screen") != std::string::npos ||
           termStr.find("rxvt") != std::string::npos ||
           termStr.find("alacritty") != std::string::npos ||
           termStr.find("foot") != std::string::npos ||
           termStr.find("kitty") != std::string::npos ||
           termStr.find("wezterm") != std::string::npos;
}

std::string getClipboardStatusMessage(const std::string &what)
{
    if (osc52Likely())
    {
        return what + " copied to clipboard";
    }
    if (std::getenv("TMUX"))
    {
        return "Clipboard not supported - tmux needs OSC 52 configuration";
    }
    return "Clipboard not supported by this terminal";
}

bool copyToClipboard(const std::string &text)
{
    if (!osc52Likely())
        return false;

    // Limit payload size to prevent issues with muxers/terminals
    constexpr size_t maxOsc52Payload = 100000;
    std::string encoded = base64Encode(text);
    if (encoded.size() > maxOsc52Payload)
    {
        spdlog::warn("clipboard payload of {} bytes exceeds the OSC 52 limit", encoded.size());
        return false;
    }

    // Try to write to /dev/tty first, fall back to stdout
    FILE *out = std::fopen("/dev/tty", "w");
    if (!out && isatty(fileno(stdout)))
    {
        out = stdout;
    }
    if (!out)
        return false;

    // Use BEL terminator instead of ST for better compatibility
    std::fprintf(out, "\033]52;c;%s\a", encoded.c_str());
    std::fflush(out);
    if (out != stdout)
    {
        std::fclose(out);
    }
    return true;
}

void setupLogging(const std::string &logFile, const std::string &level)
{
    if (logFile.empty())
    {
        // Nothing may reach the terminal while curses owns it.
        spdlog::set_level(spdlog::level::off);
        return;
    }

    auto logger = spdlog::basic_logger_mt("json-pager", logFile);
    spdlog::set_default_logger(logger);
    spdlog::level::level_enum lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off")
        lvl = spdlog::level::info;
    spdlog::set_level(lvl);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::info("json-pager {} logging at level {}", kVersion, spdlog::level::to_string_view(lvl));
}
