// instance_registry.cpp
#include "registry/instance_registry.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

std::shared_ptr<Instance> InstanceRegistry::find(const std::string& uid) const {
    std::lock_guard lg(mtx_);
    spdlog::trace("InstanceRegistry: lookup service UID {}", uid);
    for (std::size_t i = 0; i < instances_.size(); ++i) {
        if (instances_[i]->UID == uid) {
            return instances_[i];
        }
    }
    return nullptr;
}

void InstanceRegistry::upsert(std::shared_ptr<Instance> instance) {
    if (!instance || instance->UID.empty()) {
        throw std::invalid_argument("InstanceRegistry: instance without UID");
    }
    std::lock_guard lg(mtx_);
    auto it = std::find_if(instances_.begin(), instances_.end(),
                           [&](const std::shared_ptr<Instance>& i) { return i->UID == instance->UID; });
    if (it != instances_.end()) {
        spdlog::debug("InstanceRegistry: replace service {} ({})", instance->UID, instance->Name);
        *it = std::move(instance);
        return;
    }
    spdlog::debug("InstanceRegistry: add service {} ({})", instance->UID, instance->Name);
    instances_.push_back(std::move(instance));
}

bool InstanceRegistry::remove(const std::string& uid) {
    std::lock_guard lg(mtx_);
    auto it = std::find_if(instances_.begin(), instances_.end(),
                           [&](const std::shared_ptr<Instance>& i) { return i->UID == uid; });
    if (it == instances_.end()) return false;
    instances_.erase(it);
    spdlog::debug("InstanceRegistry: remove service {}", uid);
    return true;
}

std::vector<std::shared_ptr<Instance>> InstanceRegistry::snapshot() const {
    std::lock_guard lg(mtx_);
    return instances_;
}

std::size_t InstanceRegistry::size() const {
    std::lock_guard lg(mtx_);
    return instances_.size();
}
