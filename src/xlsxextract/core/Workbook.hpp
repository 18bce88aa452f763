#pragma once

#include "xlsxextract/core/Worksheet.hpp"
#include "xlsxextract/core/DefinedNameManager.hpp"
#include "xlsxextract/core/Range.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace xlsxextract {
namespace core {

/**
 * @brief 工作簿所来自的 xlsx 包的信息
 *
 * 读取器填充，写入器据此重新打包；内存中新建的工作簿 source_path 为空。
 */
struct PackageInfo {
    std::string source_path;
    std::string workbook_part = "xl/workbook.xml";
    std::string shared_strings_part;
    std::string styles_part;

    std::set<uint32_t> date_styles;       ///< cellXfs 中带日期/时间格式的下标
    std::set<uint32_t> time_only_styles;  ///< 其中只含时间记号的下标
    uint32_t cell_xf_count = 0;
    bool date1904 = false;

    bool isLoaded() const { return !source_path.empty(); }
};

/**
 * @brief 工作簿：有序的工作表集合 + 定义名称
 */
class Workbook {
public:
    Workbook() = default;

    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    // ========== 工作表管理 ==========

    /**
     * @brief 在末尾添加工作表
     * @throws WorksheetException 名称非法或重复
     */
    Worksheet& addSheet(const std::string& name);

    /**
     * @brief 按名称查找工作表，不存在时返回 nullptr
     */
    Worksheet* getSheet(const std::string& name) const;
    Worksheet* getSheet(size_t index) const;

    /**
     * @brief 工作表在工作簿中的下标，不属于本工作簿时返回 -1
     */
    int sheetIndex(const Worksheet* sheet) const;

    const std::vector<std::unique_ptr<Worksheet>>& sheets() const { return sheets_; }
    size_t sheetCount() const { return sheets_.size(); }

    // ========== 定义名称 ==========

    DefinedNameManager& definedNames() { return defined_names_; }
    const DefinedNameManager& definedNames() const { return defined_names_; }

    /**
     * @brief 定义名称；scope 为工作表下标，空表示工作簿级
     */
    void defineName(const std::string& name, const std::string& formula,
                    std::optional<int> scope = std::nullopt);

    const DefinedName* findDefinedName(const std::string& name,
                                       std::optional<int> scope = std::nullopt) const;

    // ========== 命名表格 ==========

    /**
     * @brief 查找命名表格
     * @param sheet 指定时只在该工作表中查找，否则按工作表顺序查找全部
     * @return (所在工作表, 表格)，未找到时均为 nullptr
     */
    std::pair<Worksheet*, Table*> findTable(const std::string& name,
                                            const Worksheet* sheet = nullptr) const;

    // ========== 引用 ==========

    /**
     * @brief 解析 A1 形式的引用（可带工作表名）
     * @param default_sheet 引用不带工作表名时使用
     * @return 无法解析、工作表不存在时返回空 Range
     */
    Range resolveReference(const std::string& reference, Worksheet* default_sheet = nullptr) const;

    /**
     * @brief 把区域调整为 rows x cols
     *
     * 在末行之后插入整行、末列之后插入整列（下方/右侧内容随之平移），
     * 缩小时删除尾部的行列。区域带别名时同步改写定义名称或表格的引用。
     *
     * @return 调整后的新 Range
     * @throws OperationException 空区域、尺寸不为正或区域不属于本工作簿
     */
    Range resizeRange(const Range& range, int rows, int cols);

    // ========== 包信息 ==========

    PackageInfo& package() { return package_; }
    const PackageInfo& package() const { return package_; }

private:
    void updateAliasReference(const Range& resized);

    std::vector<std::unique_ptr<Worksheet>> sheets_;
    DefinedNameManager defined_names_;
    PackageInfo package_;
};

}} // namespace xlsxextract::core
