// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: message.hpp
//  描述: Message请求负载（不透明字节串，只读共享）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace clobber {
namespace client {

// 请求负载：所有连接槽位共享同一份只读字节，拷贝只增加引用计数
class Message {
public:
    Message()
        : body_(std::make_shared<const std::vector<uint8_t>>())
    {}

    explicit Message(std::vector<uint8_t> body)
        : body_(std::make_shared<const std::vector<uint8_t>>(std::move(body)))
    {}

    static Message from_string(const std::string& text) {
        return Message(std::vector<uint8_t>(text.begin(), text.end()));
    }

    const uint8_t* data() const { return body_->data(); }
    size_t size() const { return body_->size(); }
    bool empty() const { return body_->empty(); }
    const std::vector<uint8_t>& body() const { return *body_; }

private:
    std::shared_ptr<const std::vector<uint8_t>> body_;
};

} // namespace client
} // namespace clobber

// 文件结束
