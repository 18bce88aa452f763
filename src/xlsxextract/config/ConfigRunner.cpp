#include "xlsxextract/config/ConfigRunner.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/reader/XLSXReader.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/CommonUtils.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <cmath>
#include <filesystem>
#include <limits>

namespace xlsxextract {
namespace config {

namespace {

using Operator = match::Comparator::Operator;

const char* const kBlockStartPattern = "^\\s*(directory|file|name)\\s*$";

const match::Comparator* findKey(const Block& block, const std::string& key) {
    auto it = block.find(key);
    return it == block.end() ? nullptr : &it->second;
}

// 标量键只接受 is
const core::Value* scalarOperand(const Block& block, const std::string& key) {
    const match::Comparator* comp = findKey(block, key);
    if (!comp) {
        return nullptr;
    }
    if (comp->getOperator() != Operator::Equal) {
        XLSXEXTRACT_THROW(core::ConfigurationException, fmt::format("Key `{}` must use operator `is`", key));
    }
    return &comp->getOperand();
}

std::optional<std::string> textOperand(const Block& block, const std::string& key) {
    const core::Value* value = scalarOperand(block, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->isText() || value->asText().empty()) {
        XLSXEXTRACT_THROW(core::ConfigurationException, fmt::format("Key `{}` must have a text value", key));
    }
    return value->asText();
}

std::optional<int> intOperand(const Block& block, const std::string& key) {
    const core::Value* value = scalarOperand(block, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->isNumber() || std::floor(value->asNumber()) != value->asNumber()) {
        XLSXEXTRACT_THROW(core::ConfigurationException, fmt::format("Key `{}` must have an integer value", key));
    }
    if (value->asNumber() < std::numeric_limits<int>::min() ||
        value->asNumber() > std::numeric_limits<int>::max()) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("Key `{}` value {} is out of range", key, value->asNumber()));
    }
    return static_cast<int>(value->asNumber());
}

bool flagOperand(const Block& block, const std::string& key) {
    const core::Value* value = scalarOperand(block, key);
    if (!value) {
        return false;
    }
    if (value->isBoolean()) {
        return value->asBoolean();
    }
    if (value->isText()) {
        const std::string text = utils::CommonUtils::toLower(utils::CommonUtils::trim(value->asText()));
        return text == "true" || text == "yes" || text == "1";
    }
    XLSXEXTRACT_THROW(core::ConfigurationException,
                      fmt::format("Key `{}` must have a boolean or text value", key));
}

bool hasPrefixedKey(const Block& block, const std::string& prefix) {
    for (const auto& entry : block) {
        if (utils::CommonUtils::startsWith(entry.first, prefix)) {
            return true;
        }
    }
    return false;
}

/**
 * @brief 由 prefix 开头的一组键构造 CellMatch；prefix 为空时取块的顶层键
 */
std::optional<match::CellMatch> buildCellMatch(const Block& block, const std::string& prefix,
                                               const std::string& name) {
    if (!prefix.empty() && !hasPrefixedKey(block, prefix)) {
        return std::nullopt;
    }

    match::CellMatch::Params params;
    params.name = name;
    if (const match::Comparator* sheet = findKey(block, prefix + keys::kSheet)) {
        params.sheet = *sheet;
    }
    params.reference = textOperand(block, prefix + keys::kReference);
    if (const match::Comparator* value = findKey(block, prefix + keys::kValue)) {
        params.value = *value;
    }
    params.row_offset = intOperand(block, prefix + keys::kRowOffset).value_or(0);
    params.col_offset = intOperand(block, prefix + keys::kColumnOffset).value_or(0);
    params.min_row = intOperand(block, prefix + keys::kMinRow);
    params.min_col = intOperand(block, prefix + keys::kMinColumn);
    params.max_row = intOperand(block, prefix + keys::kMaxRow);
    params.max_col = intOperand(block, prefix + keys::kMaxColumn);
    return match::CellMatch(std::move(params));
}

std::string describe(const match::MatchResult& result) {
    return result.range.getReference(false).value_or("(empty)");
}

} // namespace

ConfigRunner::ConfigRunner(core::Workbook& target, std::string source_directory,
                           std::optional<std::string> source_file, std::string config_sheet,
                           WorkbookLoader loader)
    : target_(target),
      source_directory_(std::move(source_directory)),
      source_file_(std::move(source_file)),
      config_sheet_(std::move(config_sheet)),
      loader_(std::move(loader)) {
    if (!loader_) {
        loader_ = [](const std::string& path) { return reader::XLSXReader::load(path); };
    }
}

std::optional<std::vector<Action>> ConfigRunner::run(core::Workbook& target, const std::string& source_directory,
                                                     const std::optional<std::string>& source_file,
                                                     const std::string& config_sheet) {
    ConfigRunner runner(target, source_directory, source_file, config_sheet);
    return runner.run();
}

std::optional<std::vector<Action>> ConfigRunner::run() {
    if (!target_.getSheet(config_sheet_)) {
        CONFIG_INFO("Configuration sheet {} not found", config_sheet_);
        return std::nullopt;
    }

    history_.clear();
    variables_.clear();
    source_.reset();

    if (source_file_) {
        std::filesystem::path path(*source_file_);
        if (path.is_relative()) {
            path = std::filesystem::path(source_directory_) / path;
        }
        if (!loadSourceFile(path.string(), core::Value(*source_file_))) {
            CONFIG_DEBUG("Continuing without the source file {}", path.string());
        }
    }

    match::CellMatch::Params key_params;
    key_params.name = "key";
    key_params.value = match::Comparator(Operator::Regex, core::Value(kBlockStartPattern));
    key_params.min_row = 1;
    const match::RangeMatch block_match = match::RangeMatch::contiguous(
        "block", match::CellMatch(std::move(key_params)),
        match::Comparator(Operator::Equal, core::Value(config_sheet_)));

    int next_row = 1;
    while (next_row <= utils::AddressParser::kMaxRows) {
        auto found = block_match.withStartMinRow(next_row).match(target_);
        if (!found) {
            break;
        }
        const core::Range block_range = found->range;
        next_row = block_range.lastRow() + 1;

        std::optional<Block> block;
        try {
            block = BlockParser::parseBlock(block_range, variables_);
        } catch (const core::ConfigurationException& e) {
            record(utils::CommonUtils::trim(block_range.valueAt(0, 0).toString()), false, e.what());
            continue;
        }
        if (!block) {
            CONFIG_DEBUG("Ignoring block at row {}", block_range.firstRow());
            continue;
        }

        if (block->count(keys::kDirectory) && !runDirectoryBlock(*block)) {
            continue;
        }
        if (block->count(keys::kFile) && !runFileBlock(*block)) {
            continue;
        }
        if (block->count(keys::kName)) {
            runNameBlock(*block);
        }
    }

    size_t failed = 0;
    for (const auto& action : history_) {
        if (!action.success) {
            ++failed;
        }
    }
    CONFIG_INFO("Configuration finished: {} actions, {} failed", history_.size(), failed);
    return history_;
}

void ConfigRunner::record(const std::string& name, bool success, const std::string& message) {
    if (success) {
        CONFIG_INFO("[{}] {}", name, message);
    } else {
        CONFIG_WARN("[{}] {}", name, message);
    }
    history_.emplace_back(name, success, message);
}

bool ConfigRunner::runDirectoryBlock(const Block& block) {
    std::optional<std::string> directory;
    try {
        directory = BlockParser::extractDirectory(block);
    } catch (const core::ConfigurationException& e) {
        record(keys::kDirectory, false, e.what());
        return false;
    }
    if (!directory) {
        return false;
    }
    source_directory_ = *directory;
    variables_.insert_or_assign(keys::kDirectory, core::Value(*directory));
    record(keys::kDirectory, true, fmt::format("Obtained {}", *directory));
    return true;
}

bool ConfigRunner::runFileBlock(const Block& block) {
    std::optional<BlockParser::FileSelection> selection;
    try {
        selection = BlockParser::extractFilename(block, source_directory_);
    } catch (const core::ConfigurationException& e) {
        record(keys::kFile, false, e.what());
        return false;
    }
    if (!selection) {
        return false;
    }
    return loadSourceFile(selection->path, selection->match);
}

bool ConfigRunner::loadSourceFile(const std::string& path, const core::Value& file_variable) {
    try {
        source_ = loader_(path);
    } catch (const core::XlsxExtractException& e) {
        record(keys::kFile, false, e.what());
        return false;
    }
    variables_.insert_or_assign(keys::kFile, file_variable);
    record(keys::kFile, true, fmt::format("Obtained {}", path));
    return true;
}

void ConfigRunner::runNameBlock(const Block& block) {
    const std::string name = block.at(keys::kName).getOperand().toString();

    if (!source_) {
        record(name, false, fmt::format("No source file set ahead of {}", name));
        return;
    }

    try {
        const match::Match source_match = buildSourceMatch(block, *source_);
        const std::optional<match::Target> target = buildTarget(block, source_match);

        std::optional<match::MatchResult> result = target ? target->extract(*source_, target_)
                                                          : match::matchDocument(source_match, *source_);
        if (!result) {
            record(name, false, fmt::format("{} failed to match", name));
            return;
        }

        if (target) {
            record(name, true, fmt::format("Copied {} to {}", describe(*result),
                                           textOperand(block, keys::kTarget).value_or("")));
        } else {
            record(name, true, fmt::format("Matched {}", describe(*result)));
        }
        if (result->value) {
            variables_.insert_or_assign(utils::CommonUtils::toLower(name), *result->value);
        }
    } catch (const core::XlsxExtractException& e) {
        record(name, false, e.what());
    }
}

match::Match ConfigRunner::buildSourceMatch(const Block& block, const core::Workbook& source) {
    const std::string name = block.count(keys::kName) ? block.at(keys::kName).getOperand().toString()
                                                      : std::string("source");
    std::optional<match::Comparator> sheet;
    if (const match::Comparator* comp = findKey(block, keys::kSheet)) {
        sheet = *comp;
    }

    const bool has_start = hasPrefixedKey(block, keys::kStartPrefix);
    const bool has_end = hasPrefixedKey(block, keys::kEndPrefix);
    const std::optional<int> rows = intOperand(block, keys::kRows);
    const std::optional<int> cols = intOperand(block, keys::kColumns);

    if (has_start || has_end || rows || cols) {
        match::RangeMatch::Params params;
        params.name = name;
        params.sheet = sheet;
        // 没有 start 组时以顶层的 reference / value 作为起点
        params.start_cell = has_start ? buildCellMatch(block, keys::kStartPrefix, name + " start")
                                      : buildCellMatch(block, "", name + " start");
        if (has_end) {
            params.end_cell = buildCellMatch(block, keys::kEndPrefix, name + " end");
        }
        params.rows = rows;
        params.cols = cols;
        return match::RangeMatch(std::move(params));
    }

    // 引用解析为多单元格区域（定义名称、表格、A1 区域）时按区域处理
    const std::optional<std::string> reference = textOperand(block, keys::kReference);
    if (reference && !block.count(keys::kValue)) {
        match::RangeMatch by_reference = match::RangeMatch::byReference(name, *reference, sheet);
        auto resolved = by_reference.match(source);
        if (resolved && resolved->range.isRange()) {
            return by_reference;
        }
    }

    return *buildCellMatch(block, "", name);
}

std::optional<match::Target> ConfigRunner::buildTarget(const Block& block, const match::Match& source_match) {
    const std::optional<std::string> reference = textOperand(block, keys::kTarget);
    if (!reference) {
        return std::nullopt;
    }

    std::optional<match::CellMatch> source_row = buildCellMatch(block, keys::kSourceRowPrefix, "source row");
    std::optional<match::CellMatch> source_col = buildCellMatch(block, keys::kSourceColumnPrefix, "source column");
    std::optional<match::CellMatch> target_row = buildCellMatch(block, keys::kTargetRowPrefix, "target row");
    std::optional<match::CellMatch> target_col = buildCellMatch(block, keys::kTargetColumnPrefix, "target column");

    // 源解析为单个单元格且目标没有定位器时，目标也按单元格处理
    const bool source_is_cell = !match::isRangeMatch(source_match) || (source_row && source_col);
    const bool target_is_range = target_row || target_col || !source_is_cell;

    match::Match target_match = target_is_range
        ? match::Match(match::RangeMatch::byReference("target", *reference))
        : match::Match(match::CellMatch::byReference("target", *reference));

    match::Target::Params params(source_match, std::move(target_match));
    params.source_row = std::move(source_row);
    params.source_col = std::move(source_col);
    params.target_row = std::move(target_row);
    params.target_col = std::move(target_col);
    params.expand = flagOperand(block, keys::kExpand);
    params.align = flagOperand(block, keys::kAlign);
    return match::Target(std::move(params));
}

}} // namespace xlsxextract::config
