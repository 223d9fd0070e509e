#include "metrics/metrics.hpp"

#include <stdexcept>
#include <fmt/core.h>
#include <fmt/format.h>

namespace {

const char* BGP_STATES[] = {
    "idle", "connect", "active", "opensent", "openconfirm", "established", "unknown"
};

std::string escape_label(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            default:   out += c;
        }
    }
    return out;
}

} // namespace

/*---------------- MetricVec ----------------*/
MetricVec::MetricVec(Kind kind, std::string name, std::string help, std::vector<std::string> labels)
    : kind_(kind),
      name_(VIPKEEPER_METRICS_PREFIX + std::move(name)),
      help_(std::move(help)),
      labels_(std::move(labels))
{
}

void MetricVec::check_arity(const std::vector<std::string>& values) const {
    if (values.size() != labels_.size()) {
        throw std::invalid_argument(fmt::format("Metrics: {} expects {} label values, got {}",
                                                name_, labels_.size(), values.size()));
    }
}

double MetricVec::value(const std::vector<std::string>& values) const {
    check_arity(values);
    std::lock_guard lg(mtx_);
    auto it = series_.find(values);
    return it == series_.end() ? 0.0 : it->second;
}

void MetricVec::add(const std::vector<std::string>& values, double delta) {
    check_arity(values);
    std::lock_guard lg(mtx_);
    series_[values] += delta;
}

void MetricVec::set(const std::vector<std::string>& values, double v) {
    check_arity(values);
    std::lock_guard lg(mtx_);
    series_[values] = v;
}

void MetricVec::render(std::string& out) const {
    out += fmt::format("# HELP {} {}\n", name_, help_);
    out += fmt::format("# TYPE {} {}\n", name_, kind_ == Kind::Counter ? "counter" : "gauge");
    std::lock_guard lg(mtx_);
    for (const auto& [values, v] : series_) {
        std::string labels;
        for (std::size_t i = 0; i < labels_.size(); ++i) {
            if (i) labels += ',';
            labels += fmt::format("{}=\"{}\"", labels_[i], escape_label(values[i]));
        }
        out += fmt::format("{}{{{}}} {}\n", name_, labels, v);
    }
}

void CounterVec::inc(const std::vector<std::string>& values, double delta) {
    if (delta < 0) {
        throw std::invalid_argument(fmt::format("Metrics: counter {} cannot decrease", name_));
    }
    add(values, delta);
}

/*---------------- Metrics ----------------*/
Metrics::Metrics()
    : service_events_("all_services_events",
                      "Count all events fired by the service watcher categorised by event type",
                      {"type"}),
      bgp_session_info_("bgp_session_info",
                        "Display state of session by setting metric for label value with current state to 1",
                        {"state", "peer"})
{
}

void Metrics::set_bgp_session_state(const std::string& peer, const std::string& state) {
    bool known = false;
    for (const char* s : BGP_STATES) {
        bool current = state == s;
        known = known || current;
        bgp_session_info_.set({s, peer}, current ? 1.0 : 0.0);
    }
    if (!known) {
        bgp_session_info_.set({state, peer}, 1.0);
    }
}

std::string Metrics::render() const {
    std::string out;
    service_events_.render(out);
    bgp_session_info_.render(out);
    return out;
}
