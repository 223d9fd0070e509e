#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "cluster/cluster_api.hpp"
#include "common/stop_token.hpp"
#include "common/vip_config.hpp"

// <prefix>/node-asn 等注解的键名后缀
#define VIPKEEPER_ANNOTATION_NODE_ASN "node-asn"
#define VIPKEEPER_ANNOTATION_SRC_IP   "src-ip"
#define VIPKEEPER_ANNOTATION_PEER_IP  "peer-ip"
#define VIPKEEPER_ANNOTATION_PEER_ASN "peer-asn"
#define VIPKEEPER_ANNOTATION_BGP_PASS "bgp-pass"

// 把节点注解合并进 bgp；必需注解不全返回 false 且不修改 bgp
// 数值格式错误抛 std::runtime_error
bool parse_bgp_annotations(const std::map<std::string, std::string>& annotations,
                           const std::string& prefix,
                           BgpConfig& bgp);

// 轮询节点注解直到齐全；stop 触发返回 nullopt
// 无客户端或读取节点失败抛 std::runtime_error
std::optional<BgpConfig> wait_for_bgp_annotations(ClusterApi* client,
                                                  const std::string& node,
                                                  const std::string& prefix,
                                                  const BgpConfig& base,
                                                  const StopToken& stop,
                                                  std::chrono::milliseconds poll = std::chrono::seconds(5));
