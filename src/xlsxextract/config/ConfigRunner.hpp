#pragma once

#include "xlsxextract/config/Action.hpp"
#include "xlsxextract/config/BlockParser.hpp"
#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/match/Match.hpp"
#include "xlsxextract/match/Target.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xlsxextract {
namespace config {

/**
 * @brief 执行目标工作簿中配置表描述的提取步骤
 *
 * 配置表由若干三列块组成，每块以 directory、file 或 name 开头：
 * - directory：设置源文件目录
 * - file：在目录中选定并加载源工作簿
 * - name：在源工作簿中匹配，有 target 键时把结果写入目标工作簿
 *
 * 块内的配置错误记为失败的 Action，执行继续。
 */
class ConfigRunner {
public:
    using WorkbookLoader = std::function<std::unique_ptr<core::Workbook>(const std::string&)>;

    /**
     * @param loader 加载源工作簿，默认使用 reader::XLSXReader::load
     */
    ConfigRunner(core::Workbook& target, std::string source_directory,
                 std::optional<std::string> source_file = std::nullopt,
                 std::string config_sheet = "Config", WorkbookLoader loader = WorkbookLoader());

    /**
     * @brief 执行全部块
     * @return 执行历史；目标工作簿没有配置表时返回 std::nullopt
     */
    std::optional<std::vector<Action>> run();

    static std::optional<std::vector<Action>> run(core::Workbook& target, const std::string& source_directory,
                                                  const std::optional<std::string>& source_file = std::nullopt,
                                                  const std::string& config_sheet = "Config");

    const Variables& variables() const { return variables_; }

    /**
     * @brief 由 name 块构造源匹配
     * @throws core::ConfigurationException 键的运算符或值不合法，或匹配参数组合非法
     */
    static match::Match buildSourceMatch(const Block& block, const core::Workbook& source);

    /**
     * @brief 由 name 块构造 Target；块中没有 target 键时返回 std::nullopt
     * @throws core::ConfigurationException 键不合法或源/目标形状不一致
     */
    static std::optional<match::Target> buildTarget(const Block& block, const match::Match& source_match);

private:
    bool loadSourceFile(const std::string& path, const core::Value& file_variable);
    bool runDirectoryBlock(const Block& block);
    bool runFileBlock(const Block& block);
    void runNameBlock(const Block& block);

    void record(const std::string& name, bool success, const std::string& message);

    core::Workbook& target_;
    std::string source_directory_;
    std::optional<std::string> source_file_;
    std::string config_sheet_;
    WorkbookLoader loader_;

    std::unique_ptr<core::Workbook> source_;
    Variables variables_;
    std::vector<Action> history_;
};

}} // namespace xlsxextract::config
