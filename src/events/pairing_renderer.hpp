#pragma once

#include "common/status_or.hpp"

#include <string>

namespace relay {
namespace events {

// 将传输层给出的配对码渲染为可扫描的产物
class PairingRenderer {
public:
    virtual ~PairingRenderer() = default;
    virtual common::StatusOr<std::string> Render(const std::string& account_id, const std::string& code) = 0;
};

// 原样返回配对码, 图片渲染由调用方负责
class TextPairingRenderer : public PairingRenderer {
public:
    common::StatusOr<std::string> Render(const std::string& account_id, const std::string& code) override {
        if (code.empty()) {
            return common::Status::InvalidArgument("Empty pairing code for account " + account_id);
        }
        return common::StatusOr<std::string>(code);
    }
};

}
}
