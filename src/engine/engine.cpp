#include "engine/engine.hpp"

const char* engine_name(EngineKind kind) {
    switch (kind) {
        case EngineKind::Bgp:          return "bgp";
        case EngineKind::Arp:          return "arp";
        case EngineKind::Wireguard:    return "wireguard";
        case EngineKind::RoutingTable: return "routing_table";
    }
    return "unknown";
}

std::optional<EngineKind> select_engine(const VipConfig& config) {
    if (config.EnableBGP)          return EngineKind::Bgp;
    if (config.EnableARP)          return EngineKind::Arp;
    if (config.EnableWireguard)    return EngineKind::Wireguard;
    if (config.EnableRoutingTable) return EngineKind::RoutingTable;
    return std::nullopt;
}
