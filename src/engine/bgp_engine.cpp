#include "engine/bgp_engine.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace {

const char* const SESSION_STATES[] = {
    "unknown", "idle", "connect", "active", "opensent", "openconfirm", "established",
};

std::string normalize_state(const nlohmann::json& state) {
    if (state.is_number_integer()) {
        const int v = state.get<int>();
        if (v >= 0 && v < static_cast<int>(std::size(SESSION_STATES))) {
            return SESSION_STATES[v];
        }
        return "unknown";
    }
    if (!state.is_string()) {
        return "unknown";
    }
    std::string s = state.get<std::string>();
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    // 新版 gobgp 输出 SESSION_STATE_ESTABLISHED
    const std::string prefix = "session_state_";
    if (s.rfind(prefix, 0) == 0) s.erase(0, prefix.size());
    for (const char* known : SESSION_STATES) {
        if (s == known) return s;
    }
    return "unknown";
}

std::string string_at(const nlohmann::json& j, const char* section, const char* key) {
    if (!j.contains(section) || !j[section].is_object()) return {};
    const auto& sec = j[section];
    if (!sec.contains(key) || !sec[key].is_string()) return {};
    return sec[key].get<std::string>();
}

} // namespace

std::vector<std::pair<std::string, std::string>> parse_neighbor_states(const std::string& json_text) {
    auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("gobgp neighbor output is not valid JSON");
    }
    std::vector<std::pair<std::string, std::string>> out;
    if (j.is_null()) return out;   // 没有邻居时输出 null
    if (!j.is_array()) {
        throw std::runtime_error("gobgp neighbor output is not a JSON array");
    }
    for (const auto& peer : j) {
        if (!peer.is_object()) continue;
        std::string addr = string_at(peer, "state", "neighbor_address");
        if (addr.empty()) addr = string_at(peer, "conf", "neighbor_address");
        if (addr.empty()) continue;

        std::string state = "unknown";
        if (peer.contains("state") && peer["state"].is_object() && peer["state"].contains("session_state")) {
            state = normalize_state(peer["state"]["session_state"]);
        }
        out.emplace_back(std::move(addr), std::move(state));
    }
    return out;
}

BgpEngine::BgpEngine(ClusterApi* client,
                     InstanceRegistry& registry,
                     Metrics& metrics,
                     std::shared_ptr<ProcessRunner> runner,
                     LockFactory locks,
                     LeaderElector::Options election)
    : ServiceEngine("bgp", client, registry, metrics, std::make_unique<BgpAdvertiser>(runner),
                    std::move(locks), std::move(election)),
      runner_(std::move(runner))
{
}

BgpEngine::~BgpEngine() {
    stop_background();
}

void BgpEngine::poll_sessions() {
    auto res = runner_->run({bgp_.GobgpPath, {"neighbor", "-j"}, std::chrono::milliseconds{5000}});
    if (!res.ok()) {
        spdlog::warn("BgpEngine: gobgp neighbor query failed (exit {}): {}", res.exit_code, res.output);
        return;
    }
    try {
        for (const auto& [peer, state] : parse_neighbor_states(res.output)) {
            metrics_.set_bgp_session_state(peer, state);
        }
    } catch (const std::exception& e) {
        spdlog::warn("BgpEngine: cannot parse gobgp neighbor output: {}", e.what());
    }
}

void BgpEngine::start_background(const EngineParams& params, const StopToken& stop) {
    bgp_ = params.Bgp;
    const auto interval = std::chrono::seconds(std::max(1, bgp_.SessionPollSeconds));
    monitor_ = std::thread([this, stop, interval] {
        spdlog::debug("BgpEngine: session monitor started, interval {}s", interval.count());
        do {
            try {
                poll_sessions();
            } catch (const std::exception& e) {
                spdlog::warn("BgpEngine: session poll error: {}", e.what());
            }
        } while (!stop.wait_for(interval));
        spdlog::debug("BgpEngine: session monitor stopped");
    });
}

void BgpEngine::stop_background() {
    if (monitor_.joinable()) monitor_.join();
}
