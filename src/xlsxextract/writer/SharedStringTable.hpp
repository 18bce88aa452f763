#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace xlsxextract {
namespace writer {

/**
 * @brief 写入时收集的共享字符串表
 *
 * 按首次出现的顺序编号，重复字符串复用同一下标。
 */
class SharedStringTable {
public:
    SharedStringTable() = default;

    /**
     * @brief 添加字符串，返回其下标
     */
    int addString(const std::string& str);

    /**
     * @brief 查找下标，不存在时返回 -1
     */
    int getStringIndex(const std::string& str) const;

    size_t size() const { return strings_.size(); }
    size_t referenceCount() const { return reference_count_; }
    const std::vector<std::string>& strings() const { return strings_; }

    /**
     * @brief 生成 sharedStrings.xml
     */
    std::string generate() const;

    void clear();

private:
    std::vector<std::string> strings_;
    std::unordered_map<std::string, int> string_map_;
    size_t reference_count_ = 0;
};

}} // namespace xlsxextract::writer
