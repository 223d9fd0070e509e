#pragma once

#include <optional>
#include <string>

#include "common/stop_token.hpp"
#include "common/vip_config.hpp"

// 四种通告方式互斥，声明顺序即选择优先级
enum class EngineKind {
    Bgp,
    Arp,
    Wireguard,
    RoutingTable,
};

const char* engine_name(EngineKind kind);

// 引擎启动时的附加参数；BGP 参数已合并节点注解
struct EngineParams {
    BgpConfig Bgp;
};

class IEngine {
public:
    virtual ~IEngine() = default;

    // 阻塞直到 stop 被触发；每个进程至多调用一次
    // 出错抛 std::runtime_error
    virtual void run(const std::string& node_name, const EngineParams& params, const StopToken& stop) = 0;

    virtual std::string name() const = 0;
};

// 按 BGP -> ARP -> WireGuard -> RoutingTable 取第一个开启的
std::optional<EngineKind> select_engine(const VipConfig& config);
