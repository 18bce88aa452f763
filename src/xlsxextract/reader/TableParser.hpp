#pragma once

#include "xlsxextract/reader/BaseSAXParser.hpp"
#include "xlsxextract/core/Table.hpp"

namespace xlsxextract {
namespace reader {

/**
 * @brief 解析表格部件 xl/tables/tableN.xml
 */
class TableParser : public BaseSAXParser {
public:
    const core::Table& getTable() const { return table_; }
    bool hasTable() const { return has_table_; }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                        int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

private:
    core::Table table_;
    bool has_table_ = false;
};

}} // namespace xlsxextract::reader
