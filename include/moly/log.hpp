#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace moly::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error,
};

using Sink = std::function<void(Level level, const std::string &line)>;

std::string_view level_name(Level level) noexcept;
std::optional<Level> parse_level(std::string_view text);

void set_level(Level level);
Level level();

// Replaces the stderr writer. Passing an empty sink restores stderr.
void set_sink(Sink sink);
// Lines are additionally appended to this file. An empty path disables it.
void set_file(const std::filesystem::path &path);

void write(Level level, std::string_view area, std::string_view message);

inline void debug(std::string_view area, std::string_view message) { write(Level::Debug, area, message); }
inline void info(std::string_view area, std::string_view message) { write(Level::Info, area, message); }
inline void warn(std::string_view area, std::string_view message) { write(Level::Warn, area, message); }
inline void error(std::string_view area, std::string_view message) { write(Level::Error, area, message); }

} // namespace moly::log
