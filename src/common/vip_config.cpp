#include "common/vip_config.hpp"

#include <fmt/core.h>

namespace {

const char* VIP_SECTION     = "vip_config";
const char* BGP_SECTION     = "bgp_config";
const char* METRICS_SECTION = "metrics_config";

void check_positive(const char* key, int value) {
    if (value <= 0) {
        throw std::runtime_error(fmt::format("Config: [{}][{}] must be positive, got {}", VIP_SECTION, key, value));
    }
}

} // namespace

VipConfig load_vip_config(const Config& config)
{
    VipConfig c;
    c.NodeName            = config.getString(VIP_SECTION, "node_name", "");
    c.Interface           = config.getString(VIP_SECTION, "interface", "");
    c.ServicesInterface   = config.getString(VIP_SECTION, "services_interface", "");
    c.MirrorDestInterface = config.getString(VIP_SECTION, "mirror_dest_interface", "");
    c.WireguardInterface  = config.getString(VIP_SECTION, "wireguard_interface", c.WireguardInterface);

    c.EnableBGP          = config.getBool(VIP_SECTION, "enable_bgp", false);
    c.EnableARP          = config.getBool(VIP_SECTION, "enable_arp", false);
    c.EnableWireguard    = config.getBool(VIP_SECTION, "enable_wireguard", false);
    c.EnableRoutingTable = config.getBool(VIP_SECTION, "enable_routing_table", false);

    c.LeaderElectionType = config.getString(VIP_SECTION, "leader_election_type", c.LeaderElectionType);
    if (c.LeaderElectionType != VIPKEEPER_LEADER_ELECTION_KUBERNETES &&
        c.LeaderElectionType != VIPKEEPER_LEADER_ELECTION_ETCD &&
        c.LeaderElectionType != VIPKEEPER_LEADER_ELECTION_FILE) {
        throw std::runtime_error(fmt::format("Config: unknown leader_election_type '{}'", c.LeaderElectionType));
    }
    c.KubernetesAddr     = config.getString(VIP_SECTION, "kubernetes_addr", "");
    c.EnableControlPlane = config.getBool(VIP_SECTION, "enable_control_plane", false);
    c.DetectControlPlane = config.getBool(VIP_SECTION, "detect_control_plane", false);
    c.Port               = config.getInt(VIP_SECTION, "port", c.Port);
    c.Namespace          = config.getString(VIP_SECTION, "namespace", c.Namespace);
    c.Annotations        = config.getString(VIP_SECTION, "annotations", "");

    c.LeaseDuration = config.getInt(VIP_SECTION, "lease_duration", c.LeaseDuration);
    c.RenewDeadline = config.getInt(VIP_SECTION, "renew_deadline", c.RenewDeadline);
    c.RetryPeriod   = config.getInt(VIP_SECTION, "retry_period", c.RetryPeriod);
    c.LeaseDir      = config.getString(VIP_SECTION, "lease_dir", c.LeaseDir);
    check_positive("lease_duration", c.LeaseDuration);
    check_positive("renew_deadline", c.RenewDeadline);
    check_positive("retry_period", c.RetryPeriod);
    if (c.RenewDeadline >= c.LeaseDuration) {
        throw std::runtime_error("Config: renew_deadline must be shorter than lease_duration");
    }

    c.RoutingTableID       = config.getInt(VIP_SECTION, "routing_table_id", c.RoutingTableID);
    c.RoutingTableProtocol = config.getInt(VIP_SECTION, "routing_protocol", c.RoutingTableProtocol);

    c.MetricsAddress = config.getString(METRICS_SECTION, "address", "");

    c.BGP.RouterID  = config.getString(BGP_SECTION, "router_id", "");
    c.BGP.SourceIP  = config.getString(BGP_SECTION, "source_ip", "");
    c.BGP.AS        = static_cast<uint32_t>(config.getInt(BGP_SECTION, "as", static_cast<int>(c.BGP.AS)));
    c.BGP.GobgpPath = config.getString(BGP_SECTION, "gobgp_path", c.BGP.GobgpPath);
    c.BGP.SessionPollSeconds = config.getInt(BGP_SECTION, "session_poll_seconds", c.BGP.SessionPollSeconds);
    c.BGP.Peers = config.getArray<BgpPeer>(BGP_SECTION, "peers",
        [](const YAML::Node& node) {
            BgpPeer p;
            p.Address  = node["address"].as<std::string>();
            p.AS       = node["as"].as<uint32_t>();
            p.Password = node["password"] ? node["password"].as<std::string>() : "";
            return p;
        });

    spdlog::debug("Config: vip_config loaded, interface={} election={} bgp={} arp={} wireguard={} table={}",
                  c.Interface, c.LeaderElectionType, c.EnableBGP, c.EnableARP,
                  c.EnableWireguard, c.EnableRoutingTable);
    return c;
}

const std::string& service_interface(const VipConfig& config) {
    return config.ServicesInterface.empty() ? config.Interface : config.ServicesInterface;
}
