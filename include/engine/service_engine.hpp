#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "cluster/cluster_api.hpp"
#include "election/leader_elector.hpp"
#include "engine/advertiser.hpp"
#include "engine/engine.hpp"
#include "metrics/metrics.hpp"
#include "registry/instance_registry.hpp"

// 按租约名构造一把锁
using LockFactory = std::function<std::unique_ptr<LeaseLock>(const std::string& lease_name)>;

// 每个服务一把租约：plndr-svcs-lock-<namespace>-<name>，同名不同命名空间的服务互不干扰
std::string service_lease_name(const std::string& ns, const std::string& name);

/*==========================================================
 * 按服务选主的通告引擎
 *
 * 监听 LoadBalancer 类型的 Service，每个服务一个 worker 线程；
 * worker 当选即通告 VIP，失去租约或被停止即撤销。
 * 任一 worker 通告失败会停掉整个引擎，run() 把第一个错误抛给调用方。
 * SYNC 事件携带全量列表，列表外的 worker 被停掉。
 *
 * worker 线程由引擎自己管理，不计入 ShutdownCoordinator::spawned_count()；
 * 根信号触发后 handle_event 不再启动新 worker，worker_count() 反映当前数量。
 *=========================================================*/
class ServiceEngine : public IEngine {
public:
    ServiceEngine(std::string name,
                  ClusterApi* client,
                  InstanceRegistry& registry,
                  Metrics& metrics,
                  std::unique_ptr<IAdvertiser> advertiser,
                  LockFactory locks,
                  LeaderElector::Options election);
    ~ServiceEngine() override;

    ServiceEngine(const ServiceEngine&)            = delete;
    ServiceEngine& operator=(const ServiceEngine&) = delete;

    void run(const std::string& node_name, const EngineParams& params, const StopToken& stop) override;
    std::string name() const override { return name_; }

    std::size_t worker_count() const;

protected:
    // 子类附加的后台任务，在 run 期间存活
    virtual void start_background(const EngineParams& params, const StopToken& stop) {
        (void)params;
        (void)stop;
    }
    virtual void stop_background() {}

    Metrics& metrics_;

private:
    struct Worker {
        std::string VIP;
        StopSource  Stop;
        std::thread Thread;
    };

    void handle_event(const ServiceEvent& event, const std::string& node_name, const StopToken& stop);
    void resync(const std::vector<ServiceInfo>& items, const std::string& node_name, const StopToken& stop);
    void apply_service(const ServiceInfo& svc, const std::string& node_name, const StopToken& stop);
    void start_worker(const ServiceInfo& svc, const std::string& node_name, const StopToken& stop);
    void stop_worker(const std::string& uid);
    void stop_all_workers();
    void worker_loop(Instance instance, std::string node_name, StopToken stop);

    // 只保留第一个错误并停掉引擎
    void record_error(std::exception_ptr err);

    std::string                   name_;
    ClusterApi*                   client_;
    InstanceRegistry&             registry_;
    std::unique_ptr<IAdvertiser>  advertiser_;
    LockFactory                   locks_;
    LeaderElector::Options        election_;

    std::atomic<bool>             started_{false};
    StopSource                    engine_stop_;

    mutable std::mutex            workers_mtx_;
    std::map<std::string, Worker> workers_;

    std::mutex                    err_mtx_;
    std::exception_ptr            first_error_;
};
