#include "moly/config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <optional>

namespace moly
{
namespace
{
std::string trim(std::string_view view)
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && std::isspace(static_cast<unsigned char>(view[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(view[end - 1])))
        --end;
    return std::string(view.substr(start, end - start));
}

void parse_assignment(std::string_view line, std::string &key, std::string &value)
{
    auto equal = line.find('=');
    if (equal == std::string_view::npos)
        return;
    key = trim(line.substr(0, equal));
    value = trim(line.substr(equal + 1));
}

bool is_section_header(std::string_view line, std::string &section)
{
    if (line.size() < 3 || line.front() != '[' || line.back() != ']')
        return false;
    section = trim(line.substr(1, line.size() - 2));
    return true;
}

std::string parse_string(std::string value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        return value.substr(1, value.size() - 2);
    return value;
}

std::optional<long long> parse_integer(const std::string &value)
{
    long long result = 0;
    auto begin = value.data();
    auto end = value.data() + value.size();
    auto rc = std::from_chars(begin, end, result);
    if (rc.ec == std::errc() && rc.ptr == end)
        return result;
    return std::nullopt;
}

std::optional<std::uint16_t> parse_port(const std::string &value)
{
    auto parsed = parse_integer(value);
    if (!parsed || *parsed <= 0 || *parsed > std::numeric_limits<std::uint16_t>::max())
        return std::nullopt;
    return static_cast<std::uint16_t>(*parsed);
}

std::filesystem::path home_directory()
{
    if (const char *home = std::getenv("HOME"); home && *home)
        return home;
    return {};
}
} // namespace

std::filesystem::path ConfigLoader::default_config_path()
{
    std::filesystem::path config_home;
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        config_home = xdg;
    else if (auto home = home_directory(); !home.empty())
        config_home = home / ".config";
    else
        config_home = std::filesystem::current_path();

    return config_home / "moly" / "moly.toml";
}

std::filesystem::path ConfigLoader::default_data_dir()
{
    auto home = home_directory();
    if (home.empty())
        return std::filesystem::path(".moly");
    return home / ".moly";
}

Config ConfigLoader::load_from_file(const std::filesystem::path &path)
{
    Config config;
    config.data_dir = default_data_dir();

    std::ifstream stream(path);
    if (!stream)
        return config;

    std::string line;
    std::string section;
    while (std::getline(stream, line))
    {
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = trim(line);
        if (line.empty())
            continue;

        std::string maybe_section;
        if (is_section_header(line, maybe_section))
        {
            section = maybe_section;
            continue;
        }

        std::string key;
        std::string value;
        parse_assignment(line, key, value);
        if (key.empty())
            continue;

        if (section == "storage")
        {
            if (key == "data_dir")
            {
                auto dir = parse_string(value);
                if (!dir.empty())
                    config.data_dir = dir;
            }
        }
        else if (section == "http")
        {
            if (key == "timeout_seconds")
            {
                if (auto parsed = parse_integer(value); parsed && *parsed >= 0)
                    config.http_timeout_seconds = static_cast<long>(*parsed);
            }
            else if (key == "connect_timeout_seconds")
            {
                if (auto parsed = parse_integer(value); parsed && *parsed >= 0)
                    config.connect_timeout_seconds = static_cast<long>(*parsed);
            }
        }
        else if (section == "server")
        {
            if (key == "port")
            {
                if (auto port = parse_port(value))
                    config.server_port = *port;
            }
        }
        else if (section == "log")
        {
            if (key == "level")
            {
                if (auto level = log::parse_level(parse_string(value)))
                    config.log_level = *level;
            }
            else if (key == "file")
            {
                config.log_file = parse_string(value);
            }
        }
    }

    return config;
}

void ConfigLoader::apply_environment(Config &config)
{
    if (const char *dir = std::getenv("MOLY_HOME"); dir && *dir)
        config.data_dir = dir;
    if (const char *port = std::getenv("MOLY_SERVER_PORT"); port && *port)
    {
        if (auto parsed = parse_port(port))
            config.server_port = *parsed;
    }
    if (const char *level = std::getenv("MOLY_LOG"); level && *level)
    {
        if (auto parsed = log::parse_level(level))
            config.log_level = *parsed;
    }
}

Config ConfigLoader::load_or_default()
{
    auto config = load_from_file(default_config_path());
    apply_environment(config);
    return config;
}

bool ConfigLoader::save(const Config &config, const std::filesystem::path &path)
{
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream out(path);
    if (!out.is_open())
        return false;

    out << "[storage]\n";
    out << "data_dir = \"" << config.data_dir.string() << "\"\n";

    out << "\n[http]\n";
    out << "timeout_seconds = " << config.http_timeout_seconds << "\n";
    out << "connect_timeout_seconds = " << config.connect_timeout_seconds << "\n";

    out << "\n[server]\n";
    out << "port = " << config.server_port << "\n";

    out << "\n[log]\n";
    out << "level = \"" << log::level_name(config.log_level) << "\"\n";
    if (!config.log_file.empty())
        out << "file = \"" << config.log_file.string() << "\"\n";
    return static_cast<bool>(out);
}

} // namespace moly
