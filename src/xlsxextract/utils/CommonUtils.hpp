#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <utf8.h>

namespace xlsxextract {
namespace utils {

/**
 * @brief 通用工具类 - 字符串辅助函数
 */
class CommonUtils {
public:
    // ========== 字符串工具 ==========

    /**
     * @brief 去除首尾空白
     */
    static std::string trim(const std::string& text) {
        auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        auto begin = std::find_if_not(text.begin(), text.end(), is_space);
        auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
        if (begin >= end) {
            return std::string();
        }
        return std::string(begin, end);
    }

    /**
     * @brief 转为小写（仅 ASCII）
     */
    static std::string toLower(const std::string& text) {
        std::string result = text;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * @brief 比较用的规范化形式：去空白 + 小写
     */
    static std::string normalizeLabel(const std::string& text) {
        return toLower(trim(text));
    }

    /**
     * @brief 忽略大小写比较
     */
    static bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    static bool startsWith(const std::string& text, const std::string& prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    // ========== 验证工具 ==========

    /**
     * @brief UTF-16 码元个数（Excel 按此计算名称长度），非法 UTF-8 返回 std::string::npos
     */
    static size_t utf16Length(const std::string& text) {
        if (!utf8::is_valid(text.begin(), text.end())) {
            return std::string::npos;
        }
        std::u16string utf16;
        utf8::utf8to16(text.begin(), text.end(), std::back_inserter(utf16));
        return utf16.size();
    }

    /**
     * @brief 验证工作表名称是否有效：1-31 个字符，不含 []:*?/\，不以 ' 开头或结尾
     */
    static bool isValidSheetName(const std::string& name) {
        if (name.empty()) {
            return false;
        }
        const size_t length = utf16Length(name);
        if (length == std::string::npos || length > 31) {
            return false;
        }
        const std::string invalid_chars = "[]:*?/\\";
        if (name.find_first_of(invalid_chars) != std::string::npos) {
            return false;
        }
        return name.front() != '\'' && name.back() != '\'';
    }
};

}} // namespace xlsxextract::utils
