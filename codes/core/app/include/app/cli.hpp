// =============================================================================
//  Clobber TCP Load Generator - App Module
//  文件: cli.hpp
//  描述: 命令行解析、请求负载读取与程序入口
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <istream>
#include <string>
#include "client/message.hpp"
#include "config/config.hpp"
#include "utils/error.hpp"

namespace clobber {
namespace app {

// 进程退出码
constexpr int kExitOk = 0;
constexpr int kExitRunFailure = 1;
constexpr int kExitUsage = 2;

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDefaultLogFile = "clobber.log";

// 命令行解析结果
struct CliOptions {
    config::LoadConfig config;
    std::string body_file;            // -f/--file，为空时从stdin读取
    std::string config_file;          // --config
    std::string log_file = kDefaultLogFile;
    int verbosity = 0;                // -v 出现次数
    bool pooled = false;              // --pool，每个连接一个WorkerPool worker
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief 解析命令行
 *
 * 优先级：命令行参数 > --config文件 > 默认值（命令行默认连接数为100）。
 * 解析完成后会做一次validate()。
 * @return 用法错误返回INVALID_ARGUMENT或配置相关错误码
 */
utils::Result<CliOptions> parse_args(int argc, char** argv);

// 帮助文本
std::string usage(const char* program);

/**
 * @brief 读取请求负载
 * @param options 命令行结果，设置了body_file时从文件读取
 * @param in 未指定文件时的输入流（通常是stdin）
 * @param in_is_terminal 输入流是终端时视为没有负载
 */
utils::Result<client::Message> read_body(const CliOptions& options,
                                          std::istream& in,
                                          bool in_is_terminal);

// 完整的命令行流程，返回进程退出码
int run(int argc, char** argv);

} // namespace app
} // namespace clobber

// 文件结束
