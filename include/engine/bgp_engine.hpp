#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "engine/service_engine.hpp"

// 解析 `gobgp neighbor -j` 的输出，返回 (peer, state) 列表
// state 统一为小写名称：idle / connect / active / opensent / openconfirm / established / unknown
// JSON 非法抛 std::runtime_error
std::vector<std::pair<std::string, std::string>> parse_neighbor_states(const std::string& json_text);

// BGP 引擎：在按服务选主之外，周期性采集会话状态写入 bgp_session_info
class BgpEngine : public ServiceEngine {
public:
    BgpEngine(ClusterApi* client,
              InstanceRegistry& registry,
              Metrics& metrics,
              std::shared_ptr<ProcessRunner> runner,
              LockFactory locks,
              LeaderElector::Options election);
    ~BgpEngine() override;

    // 采集一次，供监控线程与测试调用
    void poll_sessions();

protected:
    void start_background(const EngineParams& params, const StopToken& stop) override;
    void stop_background() override;

private:
    std::shared_ptr<ProcessRunner> runner_;
    BgpConfig                      bgp_;
    std::thread                    monitor_;
};
