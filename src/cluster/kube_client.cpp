#include "cluster/kube_client.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

const char* LEASE_API = "/apis/coordination.k8s.io/v1";

std::once_flag curl_once;

void ensure_curl() {
    std::call_once(curl_once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using SlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t collect_cb(char* ptr, size_t size, size_t n, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * n);
    return size * n;
}

/*---------------- watch 流 ----------------*/
struct WatchCtx {
    const ServiceEventCb* cb;
    const StopToken*      stop;
    std::string*          resource_version;
    std::string           pending;
    std::exception_ptr    error;
    bool                  expired = false;   // 410 Gone：资源版本过旧
};

size_t watch_write_cb(char* ptr, size_t size, size_t n, void* userdata) {
    auto* ctx = static_cast<WatchCtx*>(userdata);
    ctx->pending.append(ptr, size * n);
    std::size_t pos;
    while ((pos = ctx->pending.find('\n')) != std::string::npos) {
        std::string line = ctx->pending.substr(0, pos);
        ctx->pending.erase(0, pos + 1);
        if (line.empty()) continue;

        auto ev = parse_service_event(line);
        if (!ev) continue;
        if (ev->Type == "ERROR") {
            ctx->expired = true;
            return 0;
        }
        if (!ev->Service.ResourceVersion.empty()) {
            *ctx->resource_version = ev->Service.ResourceVersion;
        }
        // 异常不能穿过 libcurl 的 C 栈
        try {
            (*ctx->cb)(*ev);
        } catch (...) {
            ctx->error = std::current_exception();
            return 0;   // 中断传输
        }
    }
    return size * n;
}

int watch_progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WatchCtx*>(userdata);
    return ctx->stop->stop_requested() ? 1 : 0;
}

std::string str_at(const json& j, std::initializer_list<const char*> path) {
    const json* cur = &j;
    for (const char* key : path) {
        if (!cur->is_object() || !cur->contains(key)) return {};
        cur = &(*cur)[key];
    }
    return cur->is_string() ? cur->get<std::string>() : std::string{};
}

std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string lease_path(const std::string& ns, const std::string& name) {
    return fmt::format("{}/namespaces/{}/leases/{}", LEASE_API, ns, name);
}

} // namespace

/*==========================================================
 * 对象解析
 *=========================================================*/
std::optional<ServiceInfo> parse_service(const json& obj) {
    ServiceInfo svc;
    svc.UID = str_at(obj, {"metadata", "uid"});
    if (svc.UID.empty()) return std::nullopt;
    svc.Name            = str_at(obj, {"metadata", "name"});
    svc.Namespace       = str_at(obj, {"metadata", "namespace"});
    svc.ResourceVersion = str_at(obj, {"metadata", "resourceVersion"});
    svc.Type            = str_at(obj, {"spec", "type"});
    if (svc.Type.empty()) svc.Type = "ClusterIP";

    // 注解优先，多个地址时取第一个
    std::string ips = str_at(obj, {"metadata", "annotations", VIPKEEPER_LB_IPS_ANNOTATION});
    if (!ips.empty()) {
        svc.VIP = trim(ips.substr(0, ips.find(',')));
    }
    if (svc.VIP.empty()) {
        svc.VIP = str_at(obj, {"spec", "loadBalancerIP"});
    }
    return svc;
}

std::optional<ServiceEvent> parse_service_event(const std::string& line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("KubeClient: discarding malformed watch event ({} bytes)", line.size());
        return std::nullopt;
    }
    ServiceEvent ev;
    ev.Type = j.value("type", "");
    if (ev.Type == "ERROR") {
        spdlog::warn("KubeClient: watch error event: {}", str_at(j, {"object", "message"}));
        return ev;
    }
    if (!j.contains("object")) return std::nullopt;
    auto svc = parse_service(j["object"]);
    if (!svc) {
        // BOOKMARK 只带 resourceVersion
        if (ev.Type == "BOOKMARK") {
            ev.Service.ResourceVersion = str_at(j, {"object", "metadata", "resourceVersion"});
            return ev;
        }
        return std::nullopt;
    }
    ev.Service = std::move(*svc);
    return ev;
}

std::vector<ServiceInfo> parse_service_list(const json& list, std::string& resource_version) {
    if (!list.is_object() || !list.contains("items") || !list["items"].is_array()) {
        throw std::runtime_error("KubeClient: service list has no items array");
    }
    std::vector<ServiceInfo> out;
    for (const auto& item : list["items"]) {
        if (auto svc = parse_service(item)) out.push_back(std::move(*svc));
    }
    resource_version = str_at(list, {"metadata", "resourceVersion"});
    return out;
}

json lease_to_json(const std::string& ns, const std::string& name, const LeaseRecord& rec) {
    json j;
    j["apiVersion"] = "coordination.k8s.io/v1";
    j["kind"] = "Lease";
    j["metadata"]["name"] = name;
    j["metadata"]["namespace"] = ns;
    if (!rec.ResourceVersion.empty()) j["metadata"]["resourceVersion"] = rec.ResourceVersion;
    j["spec"]["holderIdentity"] = rec.HolderIdentity;
    j["spec"]["leaseDurationSeconds"] = rec.LeaseDurationSeconds;
    j["spec"]["leaseTransitions"] = rec.LeaseTransitions;
    if (!rec.AcquireTime.empty()) j["spec"]["acquireTime"] = rec.AcquireTime;
    if (!rec.RenewTime.empty()) j["spec"]["renewTime"] = rec.RenewTime;
    return j;
}

LeaseRecord lease_from_json(const json& obj) {
    LeaseRecord rec;
    rec.ResourceVersion = str_at(obj, {"metadata", "resourceVersion"});
    rec.HolderIdentity  = str_at(obj, {"spec", "holderIdentity"});
    rec.AcquireTime     = str_at(obj, {"spec", "acquireTime"});
    rec.RenewTime       = str_at(obj, {"spec", "renewTime"});
    if (obj.contains("spec")) {
        const auto& spec = obj["spec"];
        rec.LeaseDurationSeconds = spec.value("leaseDurationSeconds", 0);
        rec.LeaseTransitions     = spec.value("leaseTransitions", 0);
    }
    return rec;
}

/*==========================================================
 * KubeClient
 *=========================================================*/
KubeClient::KubeClient(KubeClientOptions opt) : opt_(std::move(opt)) {
    if (opt_.Server.empty()) {
        throw std::runtime_error("KubeClient: no API server address");
    }
    ensure_curl();
    spdlog::debug("KubeClient: created for {}", opt_.Server);
}

KubeClient::~KubeClient() = default;

CURL* KubeClient::new_handle(const std::string& path, curl_slist*& headers) const {
    CURL* h = curl_easy_init();
    if (!h) throw std::runtime_error("curl_easy_init failed");

    const std::string url = opt_.Server + path;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);   // 多线程下必须
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 5L);

    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (!opt_.Token.empty()) {
        headers = curl_slist_append(headers, fmt::format("Authorization: Bearer {}", opt_.Token).c_str());
    }
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers);

    if (opt_.InsecureSkipVerify) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    } else if (!opt_.CaPem.empty()) {
        curl_blob ca{const_cast<char*>(opt_.CaPem.data()), opt_.CaPem.size(), CURL_BLOB_COPY};
        curl_easy_setopt(h, CURLOPT_CAINFO_BLOB, &ca);
    }
    if (!opt_.ClientCertPem.empty() && !opt_.ClientKeyPem.empty()) {
        curl_blob cert{const_cast<char*>(opt_.ClientCertPem.data()), opt_.ClientCertPem.size(), CURL_BLOB_COPY};
        curl_blob key{const_cast<char*>(opt_.ClientKeyPem.data()), opt_.ClientKeyPem.size(), CURL_BLOB_COPY};
        curl_easy_setopt(h, CURLOPT_SSLCERTTYPE, "PEM");
        curl_easy_setopt(h, CURLOPT_SSLCERT_BLOB, &cert);
        curl_easy_setopt(h, CURLOPT_SSLKEYTYPE, "PEM");
        curl_easy_setopt(h, CURLOPT_SSLKEY_BLOB, &key);
    }
    return h;
}

KubeClient::Response KubeClient::request(const std::string& method, const std::string& path,
                                         const std::string& body, long timeout) {
    curl_slist* raw_headers = nullptr;
    CurlPtr h(new_handle(path, raw_headers), &curl_easy_cleanup);
    SlistPtr headers(raw_headers, &curl_slist_free_all);

    Response resp;
    curl_easy_setopt(h.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    if (!body.empty()) {
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, collect_cb);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, timeout > 0 ? timeout : opt_.TimeoutSeconds);

    CURLcode rc = curl_easy_perform(h.get());
    if (rc != CURLE_OK) {
        throw std::runtime_error(fmt::format("KubeClient: {} {} failed: {}", method, path, curl_easy_strerror(rc)));
    }
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &resp.code);
    spdlog::trace("KubeClient: {} {} -> {}", method, path, resp.code);
    return resp;
}

bool KubeClient::healthy() {
    try {
        auto resp = request("GET", "/version", "", 3);
        return resp.code == 200;
    } catch (const std::exception& e) {
        spdlog::debug("KubeClient: {} is not answering: {}", opt_.Server, e.what());
        return false;
    }
}

std::map<std::string, std::string> KubeClient::node_annotations(const std::string& node) {
    auto resp = request("GET", fmt::format("/api/v1/nodes/{}", node));
    if (resp.code != 200) {
        throw std::runtime_error(fmt::format("KubeClient: get node {} returned HTTP {}", node, resp.code));
    }
    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error(fmt::format("KubeClient: node {} response is not JSON", node));
    }
    std::map<std::string, std::string> out;
    if (j.contains("metadata") && j["metadata"].contains("annotations")) {
        for (const auto& [k, v] : j["metadata"]["annotations"].items()) {
            if (v.is_string()) out[k] = v.get<std::string>();
        }
    }
    return out;
}

std::vector<ServiceInfo> KubeClient::list_services(std::string& resource_version) {
    auto resp = request("GET", "/api/v1/services");
    if (resp.code != 200) {
        throw std::runtime_error(fmt::format("KubeClient: list services returned HTTP {}", resp.code));
    }
    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("KubeClient: service list response is not JSON");
    }
    return parse_service_list(j, resource_version);
}

bool KubeClient::watch_once(const ServiceEventCb& cb, const StopToken& stop, std::string& resource_version) {
    std::string path = "/api/v1/services?watch=true&timeoutSeconds=300";
    if (!resource_version.empty()) path += "&resourceVersion=" + resource_version;

    curl_slist* raw_headers = nullptr;
    CurlPtr h(new_handle(path, raw_headers), &curl_easy_cleanup);
    SlistPtr headers(raw_headers, &curl_slist_free_all);

    WatchCtx ctx{&cb, &stop, &resource_version, {}, nullptr, false};
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, watch_write_cb);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h.get(), CURLOPT_XFERINFOFUNCTION, watch_progress_cb);
    curl_easy_setopt(h.get(), CURLOPT_XFERINFODATA, &ctx);

    spdlog::debug("KubeClient: opening service watch (resourceVersion='{}')", resource_version);
    CURLcode rc = curl_easy_perform(h.get());

    if (ctx.error) std::rethrow_exception(ctx.error);
    if (stop.stop_requested()) return true;
    if (ctx.expired) {
        spdlog::info("KubeClient: service watch expired, relisting");
        resource_version.clear();
        return true;
    }
    if (rc != CURLE_OK) {
        spdlog::warn("KubeClient: service watch failed: {}", curl_easy_strerror(rc));
        return false;
    }
    long code = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &code);
    if (code != 200) {
        spdlog::warn("KubeClient: service watch returned HTTP {}", code);
        return false;
    }
    return true;
}

void KubeClient::watch_services(const ServiceEventCb& cb, const StopToken& stop) {
    std::string resource_version;
    auto backoff = 1s;
    while (!stop.stop_requested()) {
        bool ok = true;
        if (resource_version.empty()) {
            // 从头 watch 前先 list，断线期间删除的服务由 SYNC 补齐
            ServiceEvent sync;
            sync.Type = "SYNC";
            try {
                sync.Items = list_services(resource_version);
            } catch (const std::exception& e) {
                spdlog::warn("KubeClient: {}", e.what());
                resource_version.clear();
                ok = false;
            }
            if (ok) {
                spdlog::debug("KubeClient: listed {} services at resourceVersion '{}'",
                              sync.Items.size(), resource_version);
                cb(sync);
            }
        }
        if (ok && !stop.stop_requested()) ok = watch_once(cb, stop, resource_version);
        if (stop.stop_requested()) break;
        backoff = ok ? 1s : std::min<std::chrono::seconds>(backoff * 2, 30s);
        stop.wait_for(backoff);
    }
    spdlog::info("KubeClient: service watch stopped");
}

std::optional<LeaseRecord> KubeClient::get_lease(const std::string& ns, const std::string& name) {
    auto resp = request("GET", lease_path(ns, name));
    if (resp.code == 404) return std::nullopt;
    if (resp.code != 200) {
        throw std::runtime_error(fmt::format("KubeClient: get lease {}/{} returned HTTP {}", ns, name, resp.code));
    }
    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error(fmt::format("KubeClient: lease {}/{} response is not JSON", ns, name));
    }
    return lease_from_json(j);
}

bool KubeClient::create_lease(const std::string& ns, const std::string& name, const LeaseRecord& rec) {
    auto resp = request("POST", fmt::format("{}/namespaces/{}/leases", LEASE_API, ns),
                        lease_to_json(ns, name, rec).dump());
    if (resp.code == 409) return false;
    if (resp.code != 200 && resp.code != 201) {
        throw std::runtime_error(fmt::format("KubeClient: create lease {}/{} returned HTTP {}", ns, name, resp.code));
    }
    return true;
}

bool KubeClient::update_lease(const std::string& ns, const std::string& name, const LeaseRecord& rec) {
    auto resp = request("PUT", lease_path(ns, name), lease_to_json(ns, name, rec).dump());
    if (resp.code == 409) return false;
    if (resp.code != 200) {
        throw std::runtime_error(fmt::format("KubeClient: update lease {}/{} returned HTTP {}", ns, name, resp.code));
    }
    return true;
}
