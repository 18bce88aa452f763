#pragma once

#include <string>
#include <utility>

namespace xlsxextract {
namespace config {

/**
 * @brief 配置执行历史中的一条记录
 */
struct Action {
    std::string name;
    bool success = false;
    std::string message;

    Action() = default;
    Action(std::string action_name, bool ok, std::string text)
        : name(std::move(action_name)), success(ok), message(std::move(text)) {}
};

}} // namespace xlsxextract::config
