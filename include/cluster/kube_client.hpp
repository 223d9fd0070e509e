#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "cluster/cluster_api.hpp"
#include "cluster/kubeconfig.hpp"

// 解析单个 Service 对象，缺 uid 时返回 nullopt
std::optional<ServiceInfo> parse_service(const nlohmann::json& obj);

// 解析 watch 流中的一行事件
std::optional<ServiceEvent> parse_service_event(const std::string& line);

// 解析 ServiceList，列表版本写入 resource_version
std::vector<ServiceInfo> parse_service_list(const nlohmann::json& list, std::string& resource_version);

nlohmann::json lease_to_json(const std::string& ns, const std::string& name, const LeaseRecord& rec);
LeaseRecord lease_from_json(const nlohmann::json& obj);

// 基于 libcurl 的 Kubernetes REST 客户端；每次请求独立的 easy handle，可并发使用
class KubeClient : public ClusterApi {
public:
    explicit KubeClient(KubeClientOptions opt);
    ~KubeClient() override;

    KubeClient(const KubeClient&)            = delete;
    KubeClient& operator=(const KubeClient&) = delete;

    std::string server() const override { return opt_.Server; }
    bool healthy() override;
    std::map<std::string, std::string> node_annotations(const std::string& node) override;
    void watch_services(const ServiceEventCb& cb, const StopToken& stop) override;
    std::optional<LeaseRecord> get_lease(const std::string& ns, const std::string& name) override;
    bool create_lease(const std::string& ns, const std::string& name, const LeaseRecord& rec) override;
    bool update_lease(const std::string& ns, const std::string& name, const LeaseRecord& rec) override;

private:
    struct Response {
        long        code = 0;
        std::string body;
    };

    Response request(const std::string& method, const std::string& path,
                     const std::string& body = "", long timeout = -1);

    // GET /api/v1/services，失败抛 std::runtime_error
    std::vector<ServiceInfo> list_services(std::string& resource_version);

    // 单次 watch 连接；传输或 HTTP 错误返回 false，回调抛出的异常原样向上传播
    bool watch_once(const ServiceEventCb& cb, const StopToken& stop, std::string& resource_version);

    CURL* new_handle(const std::string& path, curl_slist*& headers) const;

    KubeClientOptions opt_;
};
