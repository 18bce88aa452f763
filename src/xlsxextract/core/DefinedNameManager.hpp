#pragma once

#include <string>
#include <vector>
#include <optional>

namespace xlsxextract {
namespace core {

/**
 * @brief 定义名称条目
 */
struct DefinedName {
    std::string name;                    ///< 名称
    std::string formula;                 ///< 公式或引用，例如 'Report 3'!$A$1:$E$5
    std::optional<int> local_sheet_id;   ///< 作用域：工作表下标；空表示工作簿级
    bool hidden = false;

    DefinedName() = default;
    DefinedName(const std::string& n, const std::string& f, std::optional<int> scope = std::nullopt)
        : name(n), formula(f), local_sheet_id(scope) {}

    bool isGlobal() const { return !local_sheet_id.has_value(); }
};

/**
 * @brief 定义名称管理器
 *
 * 名称查找不区分大小写（与 Excel 一致），同名不同作用域可以共存。
 */
class DefinedNameManager {
public:
    enum class Axis { Rows, Columns };

    DefinedNameManager() = default;

    /**
     * @brief 定义（或更新）名称
     * @throws ParameterException 名称非法
     */
    void define(const std::string& name, const std::string& formula,
                std::optional<int> scope = std::nullopt);

    /**
     * @brief 查找指定作用域下的名称
     * @return 不存在时返回 nullptr
     */
    const DefinedName* find(const std::string& name, std::optional<int> scope = std::nullopt) const;
    DefinedName* find(const std::string& name, std::optional<int> scope = std::nullopt);

    bool remove(const std::string& name, std::optional<int> scope = std::nullopt);

    const std::vector<DefinedName>& getAll() const { return defined_names_; }

    size_t size() const { return defined_names_.size(); }
    bool empty() const { return defined_names_.empty(); }
    void clear() { defined_names_.clear(); }

    /**
     * @brief 工作表插入行/列后修正指向该表的引用
     */
    void adjustForInsertion(const std::string& sheet_name, Axis axis, int at, int count);

    /**
     * @brief 工作表删除行/列后修正指向该表的引用，整体被删除的引用变为 #REF!
     */
    void adjustForDeletion(const std::string& sheet_name, Axis axis, int at, int count);

    /**
     * @brief 验证名称是否合法
     */
    static bool isValidName(const std::string& name);

private:
    template <typename Fn>
    void adjustReferences(const std::string& sheet_name, Fn&& adjust);

    std::vector<DefinedName> defined_names_;
};

}} // namespace xlsxextract::core
