#include "xlsxextract/config/BlockParser.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/utils/CommonUtils.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace xlsxextract {
namespace config {

namespace {

using Operator = match::Comparator::Operator;

const std::map<std::string, Operator>& operatorTable() {
    static const std::map<std::string, Operator> table = {
        {"is", Operator::Equal},
        {"=", Operator::Equal},
        {"==", Operator::Equal},
        {"is not", Operator::NotEqual},
        {"!=", Operator::NotEqual},
        {"matches", Operator::Regex},
        {"regex", Operator::Regex},
        {"<", Operator::Less},
        {"<=", Operator::LessEqual},
        {">", Operator::Greater},
        {">=", Operator::GreaterEqual},
        {"is empty", Operator::Empty},
        {"empty", Operator::Empty},
        {"is not empty", Operator::NotEmpty},
        {"not empty", Operator::NotEmpty},
    };
    return table;
}

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isNonEmptyText(const core::Value& value) {
    return value.isText() && !value.asText().empty();
}

} // namespace

std::optional<match::Comparator::Operator> BlockParser::parseOperator(const std::string& text) {
    const auto& table = operatorTable();
    auto it = table.find(utils::CommonUtils::toLower(utils::CommonUtils::trim(text)));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

match::Comparator BlockParser::parseComparator(const std::string& op, core::Value value) {
    auto parsed = parseOperator(op);
    if (!parsed) {
        XLSXEXTRACT_THROW(core::ConfigurationException, fmt::format("Operator `{}` not recognised", op));
    }
    return match::Comparator(*parsed, std::move(value));
}

std::optional<Block> BlockParser::parseBlock(const core::Range& range, const Variables& variables) {
    if (range.isEmpty() || !range.isRange() || range.columns() < 3) {
        return std::nullopt;
    }

    Block block;
    for (const auto& row : range.getValues()) {
        const core::Value& key = row[0];
        const core::Value& op = row[1];
        if (!isNonEmptyText(key) || !isNonEmptyText(op)) {
            continue;
        }

        core::Value value = interpolateVariables(row[2], variables);
        const std::string name = utils::CommonUtils::toLower(utils::CommonUtils::trim(key.asText()));
        block.insert_or_assign(name, parseComparator(op.asText(), std::move(value)));
    }

    CONFIG_DEBUG("Parsed block at {} with {} keys", range.getReference().value_or("?"), block.size());
    return block;
}

core::Value BlockParser::interpolateVariables(const core::Value& value, const Variables& variables) {
    if (!isNonEmptyText(value)) {
        return value;
    }

    const std::string& text = value.asText();
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '$') {
            out += text[i++];
            continue;
        }
        if (i + 1 < text.size() && text[i + 1] == '$') {
            out += '$';
            i += 2;
            continue;
        }

        // $name 或 ${name}
        const bool braced = i + 1 < text.size() && text[i + 1] == '{';
        size_t begin = braced ? i + 2 : i + 1;
        size_t end = begin;
        if (end < text.size() && isIdentifierStart(text[end])) {
            ++end;
            while (end < text.size() && isIdentifierChar(text[end])) {
                ++end;
            }
        }
        if (end == begin || (braced && (end >= text.size() || text[end] != '}'))) {
            out += text[i++];
            continue;
        }

        const std::string name = text.substr(begin, end - begin);
        const size_t consumed_end = braced ? end + 1 : end;
        auto it = variables.find(utils::CommonUtils::toLower(name));
        if (it == variables.end()) {
            out.append(text, i, consumed_end - i);
        } else {
            out += it->second.toString();
        }
        i = consumed_end;
    }
    return core::Value(out);
}

std::optional<std::string> BlockParser::extractDirectory(const Block& block) {
    auto it = block.find(keys::kDirectory);
    if (it == block.end()) {
        return std::nullopt;
    }
    const match::Comparator& comp = it->second;
    if (comp.getOperator() != Operator::Equal || !comp.getOperand().isText()) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          "Directory block must use operator `is` and a text value");
    }

    std::string path = comp.getOperand().asText();
    const char separator = static_cast<char>(std::filesystem::path::preferred_separator);
    std::replace(path.begin(), path.end(), '/', separator);
    return path;
}

std::optional<BlockParser::FileSelection> BlockParser::extractFilename(const Block& block,
                                                                      const std::string& directory) {
    auto it = block.find(keys::kFile);
    if (it == block.end()) {
        return std::nullopt;
    }
    const match::Comparator& comp = it->second;
    if (!comp.getOperand().isText() ||
        (comp.getOperator() != Operator::Equal && comp.getOperator() != Operator::Regex)) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          "File block must use operator `is` or `matches` and a text value");
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path dir(directory);
    if (!fs::is_directory(dir, ec)) {
        XLSXEXTRACT_THROW(core::ConfigurationException, fmt::format("Directory `{}` not found", directory));
    }

    FileSelection selection;
    std::string filename;

    if (comp.getOperator() == Operator::Equal) {
        filename = comp.getOperand().asText();
        selection.match = comp.getOperand();
    } else {
        // 按修改时间从新到旧
        std::vector<std::pair<fs::file_time_type, std::string>> files;
        for (fs::directory_iterator entry(dir, ec), end; !ec && entry != end; entry.increment(ec)) {
            std::error_code status_ec;
            if (!entry->is_regular_file(status_ec)) {
                continue;
            }
            auto mtime = entry->last_write_time(status_ec);
            if (status_ec) {
                continue;
            }
            files.emplace_back(mtime, entry->path().filename().string());
        }
        if (ec) {
            XLSXEXTRACT_THROW(core::ConfigurationException,
                              fmt::format("Cannot list directory `{}`: {}", directory, ec.message()));
        }
        std::stable_sort(files.begin(), files.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });

        for (const auto& file : files) {
            auto captured = comp.match(core::Value(file.second));
            if (captured) {
                filename = file.second;
                selection.match = *captured;
                break;
            }
        }
        if (filename.empty()) {
            XLSXEXTRACT_THROW(core::ConfigurationException,
                              fmt::format("No matching file found for `{}` in `{}`",
                                          comp.getOperand().asText(), directory));
        }
        CONFIG_DEBUG("File pattern `{}` selected {}", comp.getOperand().asText(), filename);
    }

    const fs::path full = dir / filename;
    if (!fs::is_regular_file(full, ec)) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("File `{}` not found", comp.getOperand().asText()));
    }
    selection.path = full.string();
    return selection;
}

}} // namespace xlsxextract::config
