#include "engine/service_engine.hpp"

#include <set>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

std::string service_lease_name(const std::string& ns, const std::string& name) {
    return fmt::format("{}-{}-{}", VIPKEEPER_PLUNDER_LOCK, ns, name);
}

ServiceEngine::ServiceEngine(std::string name,
                             ClusterApi* client,
                             InstanceRegistry& registry,
                             Metrics& metrics,
                             std::unique_ptr<IAdvertiser> advertiser,
                             LockFactory locks,
                             LeaderElector::Options election)
    : metrics_(metrics),
      name_(std::move(name)),
      client_(client),
      registry_(registry),
      advertiser_(std::move(advertiser)),
      locks_(std::move(locks)),
      election_(std::move(election))
{
    if (!advertiser_) {
        throw std::invalid_argument("ServiceEngine: advertiser must not be null");
    }
    if (!locks_) {
        throw std::invalid_argument("ServiceEngine: lock factory must not be empty");
    }
}

ServiceEngine::~ServiceEngine() {
    engine_stop_.request_stop();
    stop_all_workers();
}

std::size_t ServiceEngine::worker_count() const {
    std::lock_guard<std::mutex> lg(workers_mtx_);
    return workers_.size();
}

/*------------------------------------------------------
 * 主循环
 *----------------------------------------------------*/
void ServiceEngine::run(const std::string& node_name, const EngineParams& params, const StopToken& stop) {
    if (!client_) {
        throw std::runtime_error(fmt::format("{} engine requires a kubernetes client", name_));
    }
    if (started_.exchange(true)) {
        throw std::logic_error(fmt::format("{} engine is already running", name_));
    }

    // 引擎自己的停止信号挂在根信号下，出错时只停本引擎
    engine_stop_ = stop.make_child();
    const StopToken token = engine_stop_.token();

    spdlog::info("ServiceEngine: starting {} engine on node {}", name_, node_name);
    advertiser_->prepare(params);
    start_background(params, token);

    try {
        client_->watch_services(
            [&](const ServiceEvent& event) { handle_event(event, node_name, token); }, token);
    } catch (const std::exception& e) {
        spdlog::error("ServiceEngine: service watch failed: {}", e.what());
        record_error(std::current_exception());
    }

    engine_stop_.request_stop();
    stop_all_workers();
    stop_background();
    advertiser_->cleanup();
    spdlog::info("ServiceEngine: {} engine stopped", name_);

    std::exception_ptr err;
    {
        std::lock_guard<std::mutex> lg(err_mtx_);
        err = first_error_;
    }
    if (err) std::rethrow_exception(err);
}

void ServiceEngine::handle_event(const ServiceEvent& event, const std::string& node_name, const StopToken& stop) {
    metrics_.service_events().inc({event.Type});

    if (event.Type == "SYNC") {
        resync(event.Items, node_name, stop);
        return;
    }

    const ServiceInfo& svc = event.Service;
    if (svc.UID.empty()) {
        return;
    }

    if (event.Type == "DELETED") {
        stop_worker(svc.UID);
        return;
    }
    if (event.Type != "ADDED" && event.Type != "MODIFIED") {
        return;
    }
    apply_service(svc, node_name, stop);
}

// 全量列表：不在列表中的服务在断线期间已被删除
void ServiceEngine::resync(const std::vector<ServiceInfo>& items, const std::string& node_name,
                           const StopToken& stop) {
    std::set<std::string> live;
    for (const auto& svc : items) {
        if (!svc.UID.empty()) live.insert(svc.UID);
    }

    std::vector<std::string> stale;
    {
        std::lock_guard<std::mutex> lg(workers_mtx_);
        for (const auto& [uid, w] : workers_) {
            if (!live.count(uid)) stale.push_back(uid);
        }
    }
    for (const auto& uid : stale) {
        spdlog::info("ServiceEngine: service {} is gone after relist, stopping its worker", uid);
        stop_worker(uid);
    }
    for (const auto& svc : items) {
        if (!svc.UID.empty()) apply_service(svc, node_name, stop);
    }
}

void ServiceEngine::apply_service(const ServiceInfo& svc, const std::string& node_name, const StopToken& stop) {
    if (svc.Type != "LoadBalancer" || svc.VIP.empty()) {
        // 类型改了或地址被摘掉，停掉已有 worker
        stop_worker(svc.UID);
        return;
    }

    if (auto existing = registry_.find(svc.UID)) {
        if (existing->VIP == svc.VIP) {
            return;
        }
        spdlog::info("ServiceEngine: VIP of {}/{} changed {} -> {}", svc.Namespace, svc.Name,
                     existing->VIP, svc.VIP);
    }
    stop_worker(svc.UID);

    if (stop.stop_requested()) {
        spdlog::debug("ServiceEngine: shutting down, not starting worker for {}/{}", svc.Namespace, svc.Name);
        return;
    }
    start_worker(svc, node_name, stop);
}

/*------------------------------------------------------
 * worker 管理
 *----------------------------------------------------*/
void ServiceEngine::start_worker(const ServiceInfo& svc, const std::string& node_name, const StopToken& stop) {
    Instance instance;
    instance.UID       = svc.UID;
    instance.Name      = svc.Name;
    instance.Namespace = svc.Namespace;
    instance.VIP       = svc.VIP;
    registry_.upsert(std::make_shared<Instance>(instance));

    Worker w;
    w.VIP    = svc.VIP;
    w.Stop   = stop.make_child();
    w.Thread = std::thread(&ServiceEngine::worker_loop, this, std::move(instance), node_name, w.Stop.token());

    std::lock_guard<std::mutex> lg(workers_mtx_);
    workers_[svc.UID] = std::move(w);
    spdlog::info("ServiceEngine: watching leadership of {}/{} ({})", svc.Namespace, svc.Name, svc.VIP);
}

void ServiceEngine::stop_worker(const std::string& uid) {
    Worker w;
    {
        std::lock_guard<std::mutex> lg(workers_mtx_);
        auto it = workers_.find(uid);
        if (it == workers_.end()) return;
        w = std::move(it->second);
        workers_.erase(it);
    }
    w.Stop.request_stop();
    if (w.Thread.joinable()) w.Thread.join();
}

void ServiceEngine::stop_all_workers() {
    std::map<std::string, Worker> workers;
    {
        std::lock_guard<std::mutex> lg(workers_mtx_);
        workers.swap(workers_);
    }
    for (auto& [uid, w] : workers) {
        w.Stop.request_stop();
    }
    for (auto& [uid, w] : workers) {
        if (w.Thread.joinable()) w.Thread.join();
    }
}

void ServiceEngine::worker_loop(Instance instance, std::string node_name, StopToken stop) {
    const std::string lease_name = service_lease_name(instance.Namespace, instance.Name);
    try {
        LeaderElector::Options opt = election_;
        opt.identity = node_name;
        LeaderElector elector(locks_(lease_name), opt);

        elector.set_become_leader_callback([&] {
            spdlog::info("ServiceEngine: {} became leader for {}/{}", node_name, instance.Namespace, instance.Name);
            advertiser_->advertise(instance);
            registry_.upsert(std::make_shared<Instance>(instance));
        });
        elector.set_lose_leader_callback([&] {
            spdlog::info("ServiceEngine: {} lost leadership of {}/{}", node_name, instance.Namespace, instance.Name);
            try {
                advertiser_->withdraw(instance);
            } catch (const std::exception& e) {
                spdlog::error("ServiceEngine: withdraw of {} failed: {}", instance.VIP, e.what());
            }
        });

        while (!stop.stop_requested()) {
            elector.run_once(stop);
        }
    } catch (const std::exception& e) {
        spdlog::error("ServiceEngine: worker for {}/{} failed: {}", instance.Namespace, instance.Name, e.what());
        record_error(std::current_exception());
    }
    registry_.remove(instance.UID);
}

void ServiceEngine::record_error(std::exception_ptr err) {
    {
        std::lock_guard<std::mutex> lg(err_mtx_);
        if (!first_error_) first_error_ = err;
    }
    engine_stop_.request_stop();
}
