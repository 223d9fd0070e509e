// instance.h
#pragma once
#include <any>
#include <string>

// 一个正在被通告 VIP 的服务
struct Instance {
    std::string UID;          // 服务唯一标识，注册表主键
    std::string Name;
    std::string Namespace;
    std::string VIP;
    std::string Interface;
    std::any    EngineState;  // 各引擎私有，注册表不解释
};
