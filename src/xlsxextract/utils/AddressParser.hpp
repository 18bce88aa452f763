#pragma once

#include <string>
#include <optional>

namespace xlsxextract {
namespace utils {

/**
 * @brief 解析后的引用，行列均基于1
 */
struct ParsedReference {
    std::string sheet;   ///< 工作表名（已去除引号），为空表示未指定
    int first_row = 0;
    int first_col = 0;
    int last_row = 0;
    int last_col = 0;

    bool isCell() const { return first_row == last_row && first_col == last_col; }
    bool hasSheet() const { return !sheet.empty(); }
};

/**
 * @brief Excel 地址解析工具类
 *
 * 支持：
 * - 单个地址：A1, $B$2, XFD1048576
 * - 带工作表：Sheet1!A1, 'Report 1'!B2（引号内的 '' 表示单引号）
 * - 范围地址：A1:C3, 'Report 1'!$A$1:$E$5（起止顺序自动规范化）
 *
 * 行列索引全部基于1，与工作表模型一致。
 */
class AddressParser {
public:
    static constexpr int kMaxRows = 1048576;
    static constexpr int kMaxColumns = 16384;

    /**
     * @brief 解析地址或范围
     * @return 无法解析时返回 std::nullopt
     */
    static std::optional<ParsedReference> tryParse(const std::string& reference);

    /**
     * @brief 解析地址或范围
     * @throws core::CellException 格式非法
     */
    static ParsedReference parse(const std::string& reference);

    /**
     * @brief 列字母转列号 (A->1, Z->26, AA->27)，非法时返回 0
     */
    static int columnToIndex(const std::string& letters) noexcept;

    /**
     * @brief 列号转列字母 (1->A, 27->AA)
     * @throws core::CellException 列号越界
     */
    static std::string indexToColumn(int col);

    /**
     * @brief 行列转地址，absolute 时输出 $B$3 形式
     */
    static std::string formatCell(int row, int col, bool absolute = false);

    /**
     * @brief 生成范围地址；单个单元格时只输出一个地址
     */
    static std::string formatRange(int first_row, int first_col, int last_row, int last_col,
                                   bool absolute = false);

    /**
     * @brief 必要时给工作表名加引号：'Report 1'
     */
    static std::string quoteSheetName(const std::string& sheet_name);

    /**
     * @brief 工作表名是否需要引号
     */
    static bool needsQuoting(const std::string& sheet_name) noexcept;
};

}} // namespace xlsxextract::utils
