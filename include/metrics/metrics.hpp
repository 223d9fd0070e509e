#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#define VIPKEEPER_METRICS_PREFIX "vipkeeper_manager_"

// 按标签值分组的一组序列；每次更新独立加锁
class MetricVec {
public:
    enum class Kind { Counter, Gauge };

    MetricVec(Kind kind, std::string name, std::string help, std::vector<std::string> labels);

    MetricVec(const MetricVec&)            = delete;
    MetricVec& operator=(const MetricVec&) = delete;

    const std::string& name() const { return name_; }

    // 标签值个数必须与标签名一致，否则抛 std::invalid_argument
    double value(const std::vector<std::string>& values) const;

    // Prometheus 文本格式
    void render(std::string& out) const;

protected:
    void add(const std::vector<std::string>& values, double delta);
    void set(const std::vector<std::string>& values, double v);

    void check_arity(const std::vector<std::string>& values) const;

    Kind                                            kind_;
    std::string                                     name_;
    std::string                                     help_;
    std::vector<std::string>                        labels_;
    mutable std::mutex                              mtx_;
    std::map<std::vector<std::string>, double>      series_;
};

class CounterVec : public MetricVec {
public:
    CounterVec(std::string name, std::string help, std::vector<std::string> labels)
        : MetricVec(Kind::Counter, std::move(name), std::move(help), std::move(labels)) {}

    void inc(const std::vector<std::string>& values, double delta = 1.0);
};

class GaugeVec : public MetricVec {
public:
    GaugeVec(std::string name, std::string help, std::vector<std::string> labels)
        : MetricVec(Kind::Gauge, std::move(name), std::move(help), std::move(labels)) {}

    void set(const std::vector<std::string>& values, double v) { MetricVec::set(values, v); }
};

// 进程级指标，由 Manager 持有并以引用传给各组件
class Metrics {
public:
    Metrics();

    // all_services_events{type}
    CounterVec& service_events() { return service_events_; }

    // bgp_session_info{state,peer}
    GaugeVec& bgp_session_info() { return bgp_session_info_; }

    // 当前状态置 1，该 peer 的其它已知状态置 0
    void set_bgp_session_state(const std::string& peer, const std::string& state);

    std::string render() const;

private:
    CounterVec service_events_;
    GaugeVec   bgp_session_info_;
};
