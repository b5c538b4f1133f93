#pragma once

#include "moly/log.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace moly
{
struct Config
{
    std::filesystem::path data_dir;
    long http_timeout_seconds = 60;
    long connect_timeout_seconds = 10;
    std::uint16_t server_port = 8765;
    log::Level log_level = log::Level::Info;
    std::filesystem::path log_file;
};

class ConfigLoader
{
public:
    static std::filesystem::path default_config_path();
    static std::filesystem::path default_data_dir();
    static Config load_from_file(const std::filesystem::path &path);
    // Applies MOLY_HOME, MOLY_SERVER_PORT and MOLY_LOG on top of the file.
    static void apply_environment(Config &config);
    static Config load_or_default();
    static bool save(const Config &config, const std::filesystem::path &path);
};
} // namespace moly
