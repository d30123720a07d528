#pragma once

#include <string>
#include <cstdint>

#include "client.h"
#include "server.h"

namespace udpfetch {
    // 解析服务器命令行参数，出错时打印原因并返回 false
    bool parseServerCommandLine(int argc, char *argv[], ServerConfig &config);

    // 解析客户端命令行参数
    bool parseClientCommandLine(int argc, char *argv[], ClientConfig &config);

    // 校验会话参数范围
    bool validateSessionConfig(const SessionConfig &config);

    // 打印使用说明
    void printServerUsage();

    void printClientUsage();
} // namespace udpfetch
