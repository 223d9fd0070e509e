#pragma once

#include <functional>
#include <memory>
#include <string>

#include "cluster/cluster_api.hpp"
#include "common/process_runner.hpp"
#include "common/vip_config.hpp"
#include "engine/engine.hpp"
#include "engine/service_engine.hpp"
#include "metrics/metrics.hpp"
#include "registry/instance_registry.hpp"

// 构造引擎所需的共享状态，全部由 Manager 持有
struct EngineContext {
    const VipConfig&               config;
    ClusterApi*                    client;          // etcd 模式下为空
    InstanceRegistry&              registry;
    Metrics&                       metrics;
    std::shared_ptr<ProcessRunner> runner;
    std::string                    lease_namespace;
};

using EngineFactory = std::function<std::unique_ptr<IEngine>(EngineKind, EngineContext&)>;

// 按 leader_election_type 选择租约后端
LockFactory make_lock_factory(EngineContext& ctx);

LeaderElector::Options election_options(const VipConfig& config);

std::unique_ptr<IEngine> make_default_engine(EngineKind kind, EngineContext& ctx);
