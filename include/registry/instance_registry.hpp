// instance_registry.hpp
#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "registry/instance.h"

// 同一 UID 至多一条记录；所有操作持同一把互斥锁
class InstanceRegistry {
public:
    InstanceRegistry() = default;
    ~InstanceRegistry() = default;

    // 禁止拷贝
    InstanceRegistry(const InstanceRegistry&)            = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    // 未找到返回 nullptr
    std::shared_ptr<Instance> find(const std::string& uid) const;

    // 已存在则原地覆盖，否则追加
    void upsert(std::shared_ptr<Instance> instance);

    // 返回是否真的删除了记录
    bool remove(const std::string& uid);

    std::vector<std::shared_ptr<Instance>> snapshot() const;
    std::size_t size() const;

private:
    mutable std::mutex                      mtx_;
    std::vector<std::shared_ptr<Instance>>  instances_;
};
