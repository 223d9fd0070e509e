#include "manager/annotations.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

uint32_t parse_asn(const std::string& key, const std::string& value) {
    std::size_t pos = 0;
    unsigned long v = 0;
    try {
        v = std::stoul(value, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error(fmt::format("annotation {} has invalid AS number \"{}\"", key, value));
    }
    if (pos != value.size() || v > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error(fmt::format("annotation {} has invalid AS number \"{}\"", key, value));
    }
    return static_cast<uint32_t>(v);
}

const std::string* lookup(const std::map<std::string, std::string>& annotations,
                          const std::string& prefix, const char* suffix) {
    auto it = annotations.find(prefix + "/" + suffix);
    if (it == annotations.end() || trim(it->second).empty()) return nullptr;
    return &it->second;
}

} // namespace

bool parse_bgp_annotations(const std::map<std::string, std::string>& annotations,
                           const std::string& prefix,
                           BgpConfig& bgp) {
    const auto* node_asn = lookup(annotations, prefix, VIPKEEPER_ANNOTATION_NODE_ASN);
    const auto* src_ip   = lookup(annotations, prefix, VIPKEEPER_ANNOTATION_SRC_IP);
    const auto* peer_ip  = lookup(annotations, prefix, VIPKEEPER_ANNOTATION_PEER_IP);
    const auto* peer_asn = lookup(annotations, prefix, VIPKEEPER_ANNOTATION_PEER_ASN);
    if (!node_asn || !src_ip || !peer_ip || !peer_asn) {
        return false;
    }

    BgpConfig out = bgp;
    out.AS       = parse_asn(prefix + "/" VIPKEEPER_ANNOTATION_NODE_ASN, trim(*node_asn));
    out.SourceIP = trim(*src_ip);
    out.RouterID = out.SourceIP;

    const uint32_t remote_as = parse_asn(prefix + "/" VIPKEEPER_ANNOTATION_PEER_ASN, trim(*peer_asn));
    const auto* pass = lookup(annotations, prefix, VIPKEEPER_ANNOTATION_BGP_PASS);

    std::vector<BgpPeer> peers;
    std::stringstream ss(*peer_ip);
    std::string addr;
    while (std::getline(ss, addr, ',')) {
        addr = trim(addr);
        if (addr.empty()) continue;
        peers.push_back({addr, remote_as, pass ? trim(*pass) : std::string{}});
    }
    if (peers.empty()) {
        return false;
    }
    out.Peers = std::move(peers);

    bgp = std::move(out);
    return true;
}

std::optional<BgpConfig> wait_for_bgp_annotations(ClusterApi* client,
                                                  const std::string& node,
                                                  const std::string& prefix,
                                                  const BgpConfig& base,
                                                  const StopToken& stop,
                                                  std::chrono::milliseconds poll) {
    if (!client) {
        throw std::runtime_error("cannot watch node annotations without a kubernetes client");
    }
    spdlog::info("Annotations: waiting for BGP annotations with prefix {} on node {}", prefix, node);
    while (!stop.stop_requested()) {
        BgpConfig bgp = base;
        if (parse_bgp_annotations(client->node_annotations(node), prefix, bgp)) {
            spdlog::info("Annotations: node {} AS {} router-id {} with {} peer(s)",
                         node, bgp.AS, bgp.RouterID, bgp.Peers.size());
            return bgp;
        }
        spdlog::debug("Annotations: BGP annotations on {} incomplete, retrying", node);
        if (stop.wait_for(poll)) break;
    }
    return std::nullopt;
}
