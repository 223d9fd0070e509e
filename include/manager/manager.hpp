#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <signal.h>
#include <string>

#include <spdlog/spdlog.h>

#include "cluster/client_bootstrap.hpp"
#include "cluster/cluster_api.hpp"
#include "common/process_runner.hpp"
#include "common/vip_config.hpp"
#include "engine/engine.hpp"
#include "engine/engine_factory.hpp"
#include "manager/shutdown_coordinator.hpp"
#include "metrics/metrics.hpp"
#include "mirror/traffic_mirror.hpp"
#include "registry/instance_registry.hpp"

// Manager 与外界交互的入口，测试时逐项替换
struct ManagerDeps {
    std::function<std::string()>   hostname;        // 失败抛异常
    BootstrapEnv                   env;
    EngineFactory                  engine_factory;
    std::shared_ptr<ProcessRunner> runner;
    bool                           capture_signals = true;
    std::chrono::milliseconds      annotation_poll{5000};
};

// gethostname(2)，失败抛 std::runtime_error
std::string system_hostname();

ManagerDeps default_manager_deps();

/*==========================================================
 * 编排管理器
 *
 * 构造时解析节点名与集群客户端；start() 选出唯一的通告引擎并阻塞运行，
 * 直到收到 SIGINT/SIGTERM 或引擎出错，返回前完成全部清理。
 *=========================================================*/
class Manager {
public:
    // 主机名或客户端构造失败抛 std::runtime_error
    Manager(VipConfig config, ManagerDeps deps);
    ~Manager();

    Manager(const Manager&)            = delete;
    Manager& operator=(const Manager&) = delete;

    // 只能调用一次，重复调用抛 std::logic_error
    // 启动失败或引擎出错抛 std::runtime_error
    void start();

    // 等同收到信号
    bool request_shutdown(int signo = SIGTERM);

    const VipConfig& config() const { return config_; }
    const std::string& node_name() const { return config_.NodeName; }
    ClusterApi* client() const { return client_.get(); }
    InstanceRegistry& registry() { return registry_; }
    Metrics& metrics() { return metrics_; }
    ShutdownCoordinator& coordinator() { return coordinator_; }
    const TrafficMirror& mirror() const { return mirror_; }
    const std::string& lease_namespace() const { return lease_namespace_; }

    // start() 实际启动的引擎；未启动为空
    std::optional<EngineKind> started_engine() const;

private:
    EngineParams build_params(EngineKind kind);
    void spawn_metrics_server();

    ManagerDeps                  deps_;
    const VipConfig              config_;
    std::unique_ptr<ClusterApi>  client_;
    InstanceRegistry             registry_;
    Metrics                      metrics_;
    ShutdownCoordinator          coordinator_;
    TrafficMirror                mirror_;
    std::string                  lease_namespace_;

    std::atomic<bool>            started_{false};
    std::atomic<int>             started_engine_{-1};
};
