#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include "cluster/cluster_api.hpp"
#include "common/process_runner.hpp"
#include "election/lease_lock.hpp"
#include "engine/engine.hpp"

namespace fakes {

using namespace std::chrono_literals;

// 轮询等待条件成立，超时返回 false
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

inline ServiceEvent lb_event(const std::string& type, const std::string& uid, const std::string& name,
                             const std::string& vip) {
    ServiceEvent ev;
    ev.Type              = type;
    ev.Service.UID       = uid;
    ev.Service.Name      = name;
    ev.Service.Namespace = "default";
    ev.Service.Type      = "LoadBalancer";
    ev.Service.VIP       = vip;
    return ev;
}

/*---------------- ClusterApi ----------------*/
class FakeClusterApi : public ClusterApi {
public:
    explicit FakeClusterApi(std::string server = "https://fake:6443") : server_(std::move(server)) {}

    std::string server() const override { return server_; }
    bool healthy() override { return healthy_; }

    std::map<std::string, std::string> node_annotations(const std::string& node) override {
        ++annotation_reads;
        std::lock_guard<std::mutex> lg(mtx_);
        if (!annotation_error.empty()) {
            throw std::runtime_error(annotation_error);
        }
        last_node = node;
        return annotations;
    }

    void watch_services(const ServiceEventCb& cb, const StopToken& stop) override {
        ++watch_calls;
        if (!watch_error.empty()) throw std::runtime_error(watch_error);
        while (!stop.stop_requested()) {
            std::optional<ServiceEvent> ev;
            {
                std::lock_guard<std::mutex> lg(mtx_);
                if (!events_.empty()) {
                    ev = events_.front();
                    events_.pop_front();
                }
            }
            if (ev) {
                cb(*ev);
                ++delivered;
                continue;
            }
            stop.wait_for(5ms);
        }
    }

    std::optional<LeaseRecord> get_lease(const std::string& ns, const std::string& name) override {
        std::lock_guard<std::mutex> lg(mtx_);
        auto it = leases_.find(ns + "/" + name);
        if (it == leases_.end()) return std::nullopt;
        return it->second;
    }

    bool create_lease(const std::string& ns, const std::string& name, const LeaseRecord& rec) override {
        std::lock_guard<std::mutex> lg(mtx_);
        const std::string key = ns + "/" + name;
        if (leases_.count(key)) return false;
        LeaseRecord stored = rec;
        stored.ResourceVersion = std::to_string(++version_);
        leases_[key] = stored;
        return true;
    }

    bool update_lease(const std::string& ns, const std::string& name, const LeaseRecord& rec) override {
        std::lock_guard<std::mutex> lg(mtx_);
        auto it = leases_.find(ns + "/" + name);
        if (it == leases_.end() || it->second.ResourceVersion != rec.ResourceVersion) return false;
        LeaseRecord stored = rec;
        stored.ResourceVersion = std::to_string(++version_);
        it->second = stored;
        return true;
    }

    void push(ServiceEvent ev) {
        std::lock_guard<std::mutex> lg(mtx_);
        events_.push_back(std::move(ev));
    }

    std::vector<std::string> lease_names() {
        std::lock_guard<std::mutex> lg(mtx_);
        std::vector<std::string> out;
        for (const auto& [k, v] : leases_) out.push_back(k);
        return out;
    }

    bool                               healthy_ = true;
    std::map<std::string, std::string> annotations;
    std::string                        annotation_error;
    std::string                        watch_error;
    std::string                        last_node;
    std::atomic<int>                   annotation_reads{0};
    std::atomic<int>                   watch_calls{0};
    std::atomic<int>                   delivered{0};

private:
    std::string                        server_;
    std::mutex                         mtx_;
    std::deque<ServiceEvent>           events_;
    std::map<std::string, LeaseRecord> leases_;
    uint64_t                           version_ = 0;
};

/*---------------- ProcessRunner ----------------*/
// 记录命令行；tc qdisc 的增删按网卡维护状态
class FakeRunner : public ProcessRunner {
public:
    Result run(const Options& opt) override {
        const std::string cmd = fmt::format("{} {}", opt.exe, fmt::join(opt.args, " "));
        std::lock_guard<std::mutex> lg(mtx_);
        commands_.push_back(cmd);

        for (const auto& needle : fail_on) {
            if (cmd.find(needle) != std::string::npos) return {1, "simulated failure"};
        }
        if (opt.exe == "tc") return tc(opt.args);
        if (cmd == fmt::format("{} neighbor -j", opt.exe)) return {0, neighbor_json};
        return {0, ""};
    }

    std::vector<std::string> commands() const {
        std::lock_guard<std::mutex> lg(mtx_);
        return commands_;
    }

    bool ran(const std::string& cmd) const {
        std::lock_guard<std::mutex> lg(mtx_);
        for (const auto& c : commands_) {
            if (c == cmd) return true;
        }
        return false;
    }

    std::size_t count_prefix(const std::string& prefix) const {
        std::lock_guard<std::mutex> lg(mtx_);
        std::size_t n = 0;
        for (const auto& c : commands_) {
            if (c.rfind(prefix, 0) == 0) ++n;
        }
        return n;
    }

    std::set<std::string> qdiscs() const {
        std::lock_guard<std::mutex> lg(mtx_);
        return qdiscs_;
    }

    std::vector<std::string> fail_on;
    std::string              neighbor_json = "null";

private:
    // args: qdisc add dev X handle ffff: ingress | qdisc add dev X handle 1: root prio
    //       qdisc del dev X handle ffff: ingress | qdisc del dev X root | filter add dev X parent P ...
    Result tc(const std::vector<std::string>& a) {
        if (a.size() < 4) return {1, "bad tc usage"};
        const std::string& dev = a[3];
        auto has = [&](const std::string& w) {
            for (const auto& x : a) if (x == w) return true;
            return false;
        };
        const std::string kind = has("ingress") ? "ingress" : "root";
        const std::string key  = dev + ":" + kind;

        if (a[0] == "qdisc" && a[1] == "add") {
            if (qdiscs_.count(key)) return {2, "RTNETLINK answers: File exists"};
            qdiscs_.insert(key);
            return {0, ""};
        }
        if (a[0] == "qdisc" && a[1] == "del") {
            if (!qdiscs_.erase(key)) return {2, "RTNETLINK answers: Invalid argument"};
            return {0, ""};
        }
        if (a[0] == "filter" && a[1] == "add") {
            const std::string parent = has("ffff:") ? "ingress" : "root";
            if (!qdiscs_.count(dev + ":" + parent)) return {2, "Error: Parent Qdisc doesn't exists."};
            return {0, ""};
        }
        return {1, "unsupported tc command"};
    }

    mutable std::mutex       mtx_;
    std::vector<std::string> commands_;
    std::set<std::string>    qdiscs_;
};

/*---------------- LeaseLock ----------------*/
// 多个 MemoryLeaseLock 共享同一个 store 即可模拟多节点竞争
struct MemoryLeaseStore {
    std::mutex                 mtx;
    std::optional<LeaseRecord> record;
    uint64_t                   version = 0;
    std::atomic<bool>          fail{false};

    std::optional<LeaseRecord> snapshot() {
        std::lock_guard<std::mutex> lg(mtx);
        return record;
    }
};

class MemoryLeaseLock : public LeaseLock {
public:
    explicit MemoryLeaseLock(std::shared_ptr<MemoryLeaseStore> store) : store_(std::move(store)) {}

    std::optional<LeaseRecord> get() override {
        check();
        std::lock_guard<std::mutex> lg(store_->mtx);
        return store_->record;
    }

    bool create(const LeaseRecord& rec) override {
        check();
        std::lock_guard<std::mutex> lg(store_->mtx);
        if (store_->record) return false;
        store_->record = rec;
        store_->record->ResourceVersion = std::to_string(++store_->version);
        return true;
    }

    bool update(const LeaseRecord& rec) override {
        check();
        std::lock_guard<std::mutex> lg(store_->mtx);
        if (!store_->record || store_->record->ResourceVersion != rec.ResourceVersion) return false;
        store_->record = rec;
        store_->record->ResourceVersion = std::to_string(++store_->version);
        return true;
    }

    std::string describe() const override { return "memory"; }

private:
    void check() const {
        if (store_->fail) throw std::runtime_error("lease store unavailable");
    }

    std::shared_ptr<MemoryLeaseStore> store_;
};

/*---------------- IEngine ----------------*/
// 记录调用参数，阻塞到 stop
struct EngineProbe {
    std::mutex                mtx;
    std::vector<EngineKind>   built;
    std::vector<std::string>  nodes;
    std::atomic<int>          runs{0};
    EngineParams              params;
    std::string               fail_with;
};

class FakeEngine : public IEngine {
public:
    FakeEngine(EngineKind kind, std::shared_ptr<EngineProbe> probe) : kind_(kind), probe_(std::move(probe)) {}

    void run(const std::string& node_name, const EngineParams& params, const StopToken& stop) override {
        {
            std::lock_guard<std::mutex> lg(probe_->mtx);
            probe_->nodes.push_back(node_name);
            probe_->params = params;
        }
        ++probe_->runs;
        if (!probe_->fail_with.empty()) throw std::runtime_error(probe_->fail_with);
        stop.wait();
    }

    std::string name() const override { return engine_name(kind_); }

private:
    EngineKind                   kind_;
    std::shared_ptr<EngineProbe> probe_;
};

/*---------------- 日志捕获 ----------------*/
// 构造时把默认 logger 换成 ringbuffer，析构时还原
class LogCapture {
public:
    LogCapture() : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(512)) {
        previous_ = spdlog::default_logger();
        auto logger = std::make_shared<spdlog::logger>("capture", sink_);
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("[%l] %v");
        spdlog::set_default_logger(logger);
    }
    ~LogCapture() { spdlog::set_default_logger(previous_); }

    LogCapture(const LogCapture&)            = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(const std::string& needle) const {
        for (const auto& line : sink_->last_formatted()) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    std::shared_ptr<spdlog::logger>                    previous_;
};

} // namespace fakes
