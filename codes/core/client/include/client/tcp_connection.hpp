// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: tcp_connection.hpp
//  描述: TcpConnection非阻塞TCP客户端socket封装
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "config/config.hpp"

namespace clobber {
namespace client {

// 发起连接的结果
enum class ConnectStatus : uint8_t {
    CONNECTED = 0,    // 立即连上（常见于loopback）
    IN_PROGRESS = 1,  // 等待可写后调用finish_connect
    FAILED = 2        // 失败，见last_error()
};

// 单次读写的结果
enum class IoStatus : uint8_t {
    OK = 0,
    WOULD_BLOCK = 1,
    CLOSED = 2,       // 对端关闭（读到EOF）
    ERROR = 3         // 见last_error()
};

/**
 * @brief 一条非阻塞TCP客户端连接
 *
 * 持有socket fd，析构时关闭。只可移动，不可拷贝。
 */
class TcpConnection {
public:
    TcpConnection();
    ~TcpConnection();

    TcpConnection(TcpConnection&& other) noexcept;
    TcpConnection& operator=(TcpConnection&& other) noexcept;

    // 禁止拷贝
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    /**
     * @brief 创建非阻塞socket并发起连接
     * 已有连接时先关闭旧连接
     */
    ConnectStatus start_connect(const config::TargetAddress& target);

    /**
     * @brief socket可写后取连接结果
     * @return 0-已连接，否则为errno
     */
    int finish_connect();

    /**
     * @brief 尽可能多地写入
     * @param written [out] 本次写入字节数
     */
    IoStatus write_some(const uint8_t* data, size_t len, size_t& written);

    /**
     * @brief 读取一次
     * @param n [out] 本次读取字节数
     */
    IoStatus read_some(char* buf, size_t len, size_t& n);

    void close();

    int fd() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    // 最近一次失败的errno
    int last_error() const { return last_error_; }
    std::string last_error_string() const;

private:
    int fd_;
    int last_error_;
};

// 连接建立阶段的errno是否属于本地资源耗尽（fd或临时端口用尽）
bool is_resource_exhaustion(int err);

} // namespace client
} // namespace clobber

// 文件结束
