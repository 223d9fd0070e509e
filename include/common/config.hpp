#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// 两级 YAML 配置：section -> key -> 标量 / 序列
class Config {
public:
    // 从文件加载
    explicit Config(const std::string& filePath);

    // 从字符串加载（测试用）
    static Config fromString(const std::string& yaml);

    // 缺失或类型错误抛 std::runtime_error
    int         getInt   (const std::string& section, const std::string& key) const;
    bool        getBool  (const std::string& section, const std::string& key) const;
    std::string getString(const std::string& section, const std::string& key) const;

    // 键不存在时返回默认值，类型错误仍然抛出
    int         getInt   (const std::string& section, const std::string& key, int def) const;
    bool        getBool  (const std::string& section, const std::string& key, bool def) const;
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& def) const;

    bool has(const std::string& section, const std::string& key) const;

    // 序列逐项交给 decoder；键不存在返回空列表
    template <typename T>
    std::vector<T> getArray(const std::string& section,
                            const std::string& key,
                            std::function<T(const YAML::Node&)> decoder) const
    {
        std::vector<T> out;
        if (!has(section, key)) return out;
        const auto list = root_[section][key];
        if (!list.IsSequence()) {
            throw std::runtime_error("Config: [" + section + "][" + key + "] is not a sequence");
        }
        try {
            out.reserve(list.size());
            for (const auto& node : list)
                out.push_back(decoder(node));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Config: bad entry in [" + section + "][" + key + "]: " + e.what());
        }
        return out;
    }

private:
    Config() = default;

    template <typename T>
    T decode(const std::string& section, const std::string& key, const char* type) const;

    YAML::Node root_;
};
