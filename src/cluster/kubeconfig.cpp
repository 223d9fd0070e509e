#include "cluster/kubeconfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error(fmt::format("cannot read {}", path.string()));
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// 按名字在 clusters/contexts/users 列表里找条目
YAML::Node find_named(const YAML::Node& list, const std::string& name, const char* what) {
    if (list && list.IsSequence()) {
        for (const auto& item : list) {
            if (item["name"] && item["name"].as<std::string>() == name) return item;
        }
    }
    throw std::runtime_error(fmt::format("kubeconfig: {} '{}' not found", what, name));
}

// *-data 字段优先，其次是相对 kubeconfig 目录的文件路径
std::string data_or_file(const YAML::Node& node, const char* data_key, const char* file_key,
                         const fs::path& base) {
    if (node[data_key]) return base64_decode(node[data_key].as<std::string>());
    if (node[file_key]) {
        fs::path p = node[file_key].as<std::string>();
        if (p.is_relative()) p = base / p;
        return read_file(p);
    }
    return {};
}

} // namespace

std::string base64_decode(const std::string& in) {
    static const std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(in.size() * 3 / 4);
    unsigned int acc = 0;
    int bits = 0;
    for (char c : in) {
        if (c == '=' ) break;
        if (c == '\n' || c == '\r' || c == ' ') continue;
        auto pos = alphabet.find(c);
        if (pos == std::string::npos) {
            throw std::runtime_error("base64: invalid character in input");
        }
        acc = (acc << 6) | static_cast<unsigned int>(pos);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

std::string normalize_server(const std::string& address) {
    if (address.rfind("https://", 0) == 0 || address.rfind("http://", 0) == 0) {
        return address;
    }
    return "https://" + address;
}

KubeClientOptions load_kubeconfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("kubeconfig: cannot load {}: {}", path, e.what()));
    }
    const fs::path base = fs::path(path).parent_path();

    try {
        const std::string ctx_name =
            root["current-context"] ? root["current-context"].as<std::string>() : "";

        YAML::Node context(YAML::NodeType::Undefined);
        if (!ctx_name.empty()) {
            context.reset(find_named(root["contexts"], ctx_name, "context")["context"]);
        } else if (root["contexts"] && root["contexts"].IsSequence() && root["contexts"].size() > 0) {
            context.reset(root["contexts"][0]["context"]);
        }

        YAML::Node cluster(YAML::NodeType::Undefined);
        YAML::Node user(YAML::NodeType::Undefined);
        if (context.IsDefined() && context.IsMap()) {
            cluster.reset(find_named(root["clusters"], context["cluster"].as<std::string>(), "cluster")["cluster"]);
            if (context["user"]) {
                user.reset(find_named(root["users"], context["user"].as<std::string>(), "user")["user"]);
            }
        } else if (root["clusters"] && root["clusters"].IsSequence() && root["clusters"].size() > 0) {
            cluster.reset(root["clusters"][0]["cluster"]);
        }
        if (!cluster.IsDefined() || !cluster.IsMap() || !cluster["server"]) {
            throw std::runtime_error("kubeconfig: no cluster server defined");
        }

        KubeClientOptions opt;
        opt.Server = cluster["server"].as<std::string>();
        opt.InsecureSkipVerify = cluster["insecure-skip-tls-verify"] &&
                                 cluster["insecure-skip-tls-verify"].as<bool>();
        opt.CaPem = data_or_file(cluster, "certificate-authority-data", "certificate-authority", base);
        if (user.IsDefined() && user.IsMap()) {
            if (user["token"]) opt.Token = user["token"].as<std::string>();
            opt.ClientCertPem = data_or_file(user, "client-certificate-data", "client-certificate", base);
            opt.ClientKeyPem  = data_or_file(user, "client-key-data", "client-key", base);
        }
        spdlog::debug("kubeconfig: {} -> server {}", path, opt.Server);
        return opt;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("kubeconfig: malformed {}: {}", path, e.what()));
    }
}

KubeClientOptions in_cluster_options() {
    const char* host = std::getenv("KUBERNETES_SERVICE_HOST");
    const char* port = std::getenv("KUBERNETES_SERVICE_PORT");
    if (!host || !port || !*host || !*port) {
        throw std::runtime_error("unable to load in-cluster configuration, "
                                 "KUBERNETES_SERVICE_HOST and KUBERNETES_SERVICE_PORT must be defined");
    }
    std::string h = host;
    if (h.find(':') != std::string::npos) h = "[" + h + "]";   // IPv6

    const fs::path sa = VIPKEEPER_SERVICE_ACCOUNT_DIR;
    KubeClientOptions opt;
    opt.Server = fmt::format("https://{}:{}", h, port);
    opt.Token  = read_file(sa / "token");
    while (!opt.Token.empty() && (opt.Token.back() == '\n' || opt.Token.back() == '\r')) {
        opt.Token.pop_back();
    }
    opt.CaPem = read_file(sa / "ca.crt");
    return opt;
}
