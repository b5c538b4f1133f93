#include "moly/log.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace moly::log
{
namespace
{
struct LogState
{
    std::mutex mutex;
    Level threshold = Level::Info;
    Sink sink;
    std::filesystem::path file;
};

LogState &state()
{
    static LogState instance;
    return instance;
}
} // namespace

std::string_view level_name(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warn:
        return "warn";
    case Level::Error:
        return "error";
    }
    return "info";
}

std::optional<Level> parse_level(std::string_view text)
{
    std::string lower;
    lower.reserve(text.size());
    for (char ch : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

    if (lower == "debug" || lower == "trace")
        return Level::Debug;
    if (lower == "info")
        return Level::Info;
    if (lower == "warn" || lower == "warning")
        return Level::Warn;
    if (lower == "error")
        return Level::Error;
    return std::nullopt;
}

void set_level(Level level)
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().threshold = level;
}

Level level()
{
    std::lock_guard<std::mutex> lock(state().mutex);
    return state().threshold;
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().sink = std::move(sink);
}

void set_file(const std::filesystem::path &path)
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().file = path;
}

void write(Level level, std::string_view area, std::string_view message)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (static_cast<int>(level) < static_cast<int>(s.threshold))
        return;

    std::string line;
    line.reserve(area.size() + message.size() + 12);
    line.push_back('[');
    line.append(level_name(level));
    line.append("] ");
    line.append(area);
    line.append(": ");
    line.append(message);

    if (s.sink)
        s.sink(level, line);
    else
        std::cerr << line << '\n';

    if (s.file.empty())
        return;
    std::ofstream out(s.file, std::ios::app);
    if (!out.is_open())
        return;
    out << line << '\n';
}

} // namespace moly::log
