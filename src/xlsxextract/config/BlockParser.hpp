#pragma once

#include "xlsxextract/core/Range.hpp"
#include "xlsxextract/core/Value.hpp"
#include "xlsxextract/match/Comparator.hpp"
#include <map>
#include <optional>
#include <string>

namespace xlsxextract {
namespace config {

/// 配置块：小写键 -> 比较器
using Block = std::map<std::string, match::Comparator>;

/// 变量表，键为小写
using Variables = std::map<std::string, core::Value>;

/**
 * @brief 配置块中的键
 */
namespace keys {
constexpr const char* kDirectory = "directory";
constexpr const char* kFile = "file";
constexpr const char* kName = "name";
constexpr const char* kSheet = "sheet";
constexpr const char* kReference = "reference";
constexpr const char* kValue = "value";
constexpr const char* kTarget = "target";
constexpr const char* kExpand = "expand";
constexpr const char* kAlign = "align";
constexpr const char* kMinRow = "min row";
constexpr const char* kMaxRow = "max row";
constexpr const char* kMinColumn = "min column";
constexpr const char* kMaxColumn = "max column";
constexpr const char* kRowOffset = "row offset";
constexpr const char* kColumnOffset = "column offset";
constexpr const char* kRows = "rows";
constexpr const char* kColumns = "columns";

constexpr const char* kStartPrefix = "start ";
constexpr const char* kEndPrefix = "end ";
constexpr const char* kSourceRowPrefix = "source row ";
constexpr const char* kSourceColumnPrefix = "source column ";
constexpr const char* kTargetRowPrefix = "target row ";
constexpr const char* kTargetColumnPrefix = "target column ";
} // namespace keys

/**
 * @brief 解析配置表中 键 / 运算符 / 值 三列构成的块
 */
class BlockParser {
public:
    /**
     * @brief 查运算符表（去空白、不区分大小写），未知时返回 std::nullopt
     */
    static std::optional<match::Comparator::Operator> parseOperator(const std::string& text);

    /**
     * @throws core::ConfigurationException 运算符未知
     * @throws core::InvalidComparator 比较器非法（例如正则无法编译）
     */
    static match::Comparator parseComparator(const std::string& op, core::Value value);

    /**
     * @brief 把区域解析为配置块
     *
     * 区域为空、不是多单元格区域或少于3列时返回 std::nullopt。
     * 键或运算符不是非空文本的行被跳过；值先做变量替换。
     *
     * @throws core::ConfigurationException 运算符未知
     */
    static std::optional<Block> parseBlock(const core::Range& range, const Variables& variables);

    /**
     * @brief 安全模板替换：$name 与 ${name}
     *
     * 变量名不区分大小写，未知变量原样保留，$$ 变为 $。非文本或空文本原样返回。
     */
    static core::Value interpolateVariables(const core::Value& value, const Variables& variables);

    /**
     * @brief 取 directory 键
     *
     * 没有 directory 键时返回 std::nullopt。
     * @throws core::ConfigurationException 运算符不是 is 或值不是文本
     * 返回的路径中 / 换成本地路径分隔符。
     */
    static std::optional<std::string> extractDirectory(const Block& block);

    struct FileSelection {
        std::string path;   ///< 目录 + 文件名
        core::Value match;  ///< 赋给 file 变量的值
    };

    /**
     * @brief 取 file 键并在目录中定位文件
     *
     * is 直接给出文件名；matches 在目录中按修改时间从新到旧取第一个名称匹配的文件。
     * 没有 file 键时返回 std::nullopt。
     *
     * @throws core::ConfigurationException 运算符或值类型不对、目录或文件不存在、没有匹配的文件
     */
    static std::optional<FileSelection> extractFilename(const Block& block, const std::string& directory);
};

}} // namespace xlsxextract::config
