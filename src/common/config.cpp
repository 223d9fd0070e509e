#include "common/config.hpp"

#include <fmt/core.h>

Config::Config(const std::string& filePath)
{
    try {
        root_ = YAML::LoadFile(filePath);
    } catch (const YAML::BadFile& e) {
        spdlog::error("Config: failed to open configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot open file: " + filePath);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: failed to parse configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot parse file: " + filePath);
    }
    spdlog::info("Config: loaded configuration from {}", filePath);
}

Config Config::fromString(const std::string& yaml)
{
    Config c;
    try {
        c.root_ = YAML::Load(yaml);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(std::string("Config: cannot parse document: ") + e.what());
    }
    return c;
}

template <typename T>
T Config::decode(const std::string& section, const std::string& key, const char* type) const
{
    try {
        return root_[section][key].as<T>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding {} [{}][{}]: {}", type, section, key, e.what());
        throw std::runtime_error(fmt::format("Config: missing or bad {} for [{}][{}]", type, section, key));
    }
}

int Config::getInt(const std::string& section, const std::string& key) const
{
    return decode<int>(section, key, "int");
}

bool Config::getBool(const std::string& section, const std::string& key) const
{
    return decode<bool>(section, key, "bool");
}

std::string Config::getString(const std::string& section, const std::string& key) const
{
    return decode<std::string>(section, key, "string");
}

int Config::getInt(const std::string& section, const std::string& key, int def) const
{
    return has(section, key) ? getInt(section, key) : def;
}

bool Config::getBool(const std::string& section, const std::string& key, bool def) const
{
    return has(section, key) ? getBool(section, key) : def;
}

std::string Config::getString(const std::string& section, const std::string& key,
                              const std::string& def) const
{
    return has(section, key) ? getString(section, key) : def;
}

bool Config::has(const std::string& section, const std::string& key) const
{
    if (!root_[section]) return false;
    const auto node = root_[section][key];
    return node && !node.IsNull();
}
