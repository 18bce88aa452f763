#include "xlsxextract/writer/XLSXWriter.hpp"
#include "xlsxextract/writer/DateStyleAllocator.hpp"
#include "xlsxextract/writer/SharedStringTable.hpp"
#include "xlsxextract/writer/WorksheetXMLGenerator.hpp"
#include "xlsxextract/archive/ZipReader.hpp"
#include "xlsxextract/archive/ZipWriter.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/CommonUtils.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include "xlsxextract/xml/XMLStreamWriter.hpp"
#include <fmt/format.h>
#include <cstring>
#include <filesystem>
#include <map>
#include <set>
#include <system_error>

namespace xlsxextract {
namespace writer {

namespace {

const char* const kMainNamespace = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
const char* const kRelNamespace = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
const char* const kPackageRelNamespace = "http://schemas.openxmlformats.org/package/2006/relationships";
const char* const kContentTypesNamespace = "http://schemas.openxmlformats.org/package/2006/content-types";

const char* const kRelTypeBase = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";

const char* const kContentTypeBase = "application/vnd.openxmlformats-officedocument.spreadsheetml.";

// 最小样式：一个字体、两个填充、一个边框、一个单元格格式
const char* const kTemplateStyles =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<styleSheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">"
    "<fonts count=\"1\"><font><sz val=\"11\"/><name val=\"Calibri\"/><family val=\"2\"/></font></fonts>"
    "<fills count=\"2\"><fill><patternFill patternType=\"none\"/></fill>"
    "<fill><patternFill patternType=\"gray125\"/></fill></fills>"
    "<borders count=\"1\"><border><left/><right/><top/><bottom/><diagonal/></border></borders>"
    "<cellStyleXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\"/></cellStyleXfs>"
    "<cellXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\" xfId=\"0\"/></cellXfs>"
    "<cellStyles count=\"1\"><cellStyle name=\"Normal\" xfId=\"0\" builtinId=\"0\"/></cellStyles>"
    "</styleSheet>";

const char* const kTemplateWorksheetPrefix =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
    "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
    "<dimension ref=\"A1\"/>";

struct RelationshipEntry {
    std::string id;
    std::string type;
    std::string target;
};

std::string generateRelationships(const std::vector<RelationshipEntry>& relationships) {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", kPackageRelNamespace);
    for (const auto& rel : relationships) {
        writer.startElement("Relationship");
        writer.writeAttribute("Id", std::string_view(rel.id));
        writer.writeAttribute("Type", std::string_view(std::string(kRelTypeBase) + rel.type));
        writer.writeAttribute("Target", std::string_view(rel.target));
        writer.endElement(); // Relationship
    }
    writer.endElement(); // Relationships
    return writer.toString();
}

std::string headerName(const core::Value& value, int column) {
    if (value.isText() && !utils::CommonUtils::trim(value.asText()).empty()) {
        return value.asText();
    }
    if (!value.isBlank()) {
        return value.toString();
    }
    return fmt::format("Column{}", column);
}

} // namespace

XLSXWriter::XLSXWriter(const core::Workbook& workbook)
    : workbook_(workbook) {
}

void XLSXWriter::save(const core::Workbook& workbook, const std::string& path) {
    XLSXWriter writer(workbook);
    writer.write(path);
}

void XLSXWriter::write(const std::string& path) {
    std::vector<Part> parts = workbook_.package().isLoaded() ? buildRepackedParts() : buildTemplateParts();

    const std::string temp_path = path + ".tmp";
    archive::ZipWriter zip(temp_path);
    archive::ZipError opened = zip.open();
    if (opened != archive::ZipError::Ok) {
        throw core::FileException(fmt::format("Cannot create {}: {}", temp_path, archive::toString(opened)),
                                  path, core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }

    try {
        for (const auto& part : parts) {
            addPart(zip, part, path);
        }
        archive::ZipError closed = zip.close();
        if (closed != archive::ZipError::Ok) {
            throw core::FileException(fmt::format("Cannot finalize {}: {}", temp_path, archive::toString(closed)),
                                      path, core::ErrorCode::FileWriteError, __FILE__, __LINE__);
        }
    } catch (const std::exception&) {
        if (zip.isOpen() && zip.close() != archive::ZipError::Ok) {
            WRITER_WARN("Failed to close partial output {}", temp_path);
        }
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw;
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw core::FileException(fmt::format("Cannot replace {}: {}", path, ec.message()),
                                  path, core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }
    WRITER_INFO("Saved {} ({} parts)", path, parts.size());
}

void XLSXWriter::addPart(archive::ZipWriter& zip, const Part& part, const std::string& target) {
    archive::ZipError result = zip.addFile(part.first, part.second);
    if (result != archive::ZipError::Ok) {
        throw core::FileException(fmt::format("Cannot write part {}: {}", part.first, archive::toString(result)),
                                  target, core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }
}

// ========== 按原包重新打包 ==========

std::vector<XLSXWriter::Part> XLSXWriter::buildRepackedParts() {
    const core::PackageInfo& package = workbook_.package();

    archive::ZipReader source(package.source_path);
    archive::ZipError opened = source.open();
    if (opened != archive::ZipError::Ok) {
        throw core::FileException(fmt::format("Cannot reopen source package {}: {}",
                                              package.source_path, archive::toString(opened)),
                                  package.source_path,
                                  opened == archive::ZipError::FileNotFound ? core::ErrorCode::FileNotFound
                                                                            : core::ErrorCode::FileReadError,
                                  __FILE__, __LINE__);
    }

    auto read_part = [&](const std::string& part_path) {
        std::string content;
        archive::ZipError result = source.extractFile(part_path, content);
        if (result != archive::ZipError::Ok) {
            XLSXEXTRACT_THROW(core::FormatException,
                              fmt::format("Cannot read part {} from {}: {}", part_path, package.source_path,
                                          archive::toString(result)));
        }
        return content;
    };

    const bool has_styles = !package.styles_part.empty();
    DateStyleAllocator styles(package.date_styles, package.cell_xf_count, has_styles);
    SharedStringTable sst;
    SharedStringTable* sst_ptr = package.shared_strings_part.empty() ? nullptr : &sst;
    if (!has_styles) {
        WRITER_DEBUG("Package {} has no styles part, temporal values keep their cell style", package.source_path);
    }

    std::map<std::string, std::string> generated;
    for (const auto& sheet : workbook_.sheets()) {
        if (sheet->getPartPath().empty()) {
            XLSXEXTRACT_THROW(core::OperationException,
                              fmt::format("Worksheet {} has no part in {}; adding sheets to a loaded "
                                          "workbook is not supported", sheet->getName(), package.source_path));
        }
        // 图表工作表等未解析的部件原样复制
        if (sheet->getXmlPrefix().empty()) {
            continue;
        }

        WorksheetXMLGenerator generator(*sheet, styles, sst_ptr, package.date1904);
        generated[sheet->getPartPath()] = generator.generate(sheet->getXmlPrefix(), sheet->getXmlSuffix());

        for (const auto& table : sheet->tables()) {
            if (table.part_path.empty()) {
                XLSXEXTRACT_THROW(core::OperationException,
                                  fmt::format("Table {} has no part in {}; adding tables to a loaded "
                                              "workbook is not supported", table.display_name, package.source_path));
            }
            generated[table.part_path] = generateTable(table, *sheet, table.id);
        }
    }

    generated[package.workbook_part] =
        spliceDefinedNames(read_part(package.workbook_part), generateDefinedNames(workbook_.definedNames()));

    if (sst_ptr) {
        generated[package.shared_strings_part] = sst.generate();
    }
    if (styles.hasAppended()) {
        generated[package.styles_part] = styles.patchStyles(read_part(package.styles_part));
    }

    std::vector<Part> parts;
    for (const auto& entry : source.listFiles()) {
        auto it = generated.find(entry);
        if (it != generated.end()) {
            parts.emplace_back(entry, std::move(it->second));
            generated.erase(it);
            continue;
        }
        parts.emplace_back(entry, read_part(entry));
    }
    // 关系中引用但包中缺失的部件（例如空的 sharedStrings）
    for (auto& [path, content] : generated) {
        WRITER_WARN("Part {} was missing from the source package, written anew", path);
        parts.emplace_back(path, std::move(content));
    }

    source.close();
    WRITER_DEBUG("Repacked {}: {} parts, {} shared strings", package.source_path, parts.size(), sst.size());
    return parts;
}

// ========== 新建工作簿的最小包 ==========

std::vector<XLSXWriter::Part> XLSXWriter::buildTemplateParts() {
    const core::PackageInfo& package = workbook_.package();

    DateStyleAllocator styles(package.date_styles, 1);
    SharedStringTable sst;

    std::vector<Part> sheet_parts;
    std::vector<std::pair<std::string, std::string>> overrides;  // PartName -> ContentType
    std::vector<RelationshipEntry> workbook_rels;

    overrides.emplace_back("/xl/workbook.xml", std::string(kContentTypeBase) + "sheet.main+xml");

    int table_number = 0;
    for (size_t i = 0; i < workbook_.sheetCount(); ++i) {
        const core::Worksheet& sheet = *workbook_.getSheet(i);
        const std::string sheet_file = fmt::format("sheet{}.xml", i + 1);
        const std::string sheet_path = "xl/worksheets/" + sheet_file;

        workbook_rels.push_back({fmt::format("rId{}", i + 1), "worksheet", "worksheets/" + sheet_file});
        overrides.emplace_back("/" + sheet_path, std::string(kContentTypeBase) + "worksheet+xml");

        std::string suffix;
        std::vector<RelationshipEntry> sheet_rels;
        std::vector<Part> table_parts;
        if (!sheet.tables().empty()) {
            suffix = fmt::format("<tableParts count=\"{}\">", sheet.tables().size());
            for (const auto& table : sheet.tables()) {
                ++table_number;
                const std::string rel_id = fmt::format("rId{}", sheet_rels.size() + 1);
                const std::string table_file = fmt::format("table{}.xml", table_number);
                sheet_rels.push_back({rel_id, "table", "../tables/" + table_file});
                suffix += fmt::format("<tablePart r:id=\"{}\"/>", rel_id);
                table_parts.emplace_back("xl/tables/" + table_file, generateTable(table, sheet, table_number));
                overrides.emplace_back("/xl/tables/" + table_file, std::string(kContentTypeBase) + "table+xml");
            }
            suffix += "</tableParts>";
        }
        suffix += "</worksheet>";

        WorksheetXMLGenerator generator(sheet, styles, &sst, package.date1904);
        sheet_parts.emplace_back(sheet_path, generator.generate(kTemplateWorksheetPrefix, suffix));
        if (!sheet_rels.empty()) {
            sheet_parts.emplace_back("xl/worksheets/_rels/" + sheet_file + ".rels", generateRelationships(sheet_rels));
        }
        for (auto& part : table_parts) {
            sheet_parts.push_back(std::move(part));
        }
    }

    const size_t sheet_count = workbook_.sheetCount();
    workbook_rels.push_back({fmt::format("rId{}", sheet_count + 1), "styles", "styles.xml"});
    workbook_rels.push_back({fmt::format("rId{}", sheet_count + 2), "sharedStrings", "sharedStrings.xml"});
    overrides.emplace_back("/xl/styles.xml", std::string(kContentTypeBase) + "styles+xml");
    overrides.emplace_back("/xl/sharedStrings.xml", std::string(kContentTypeBase) + "sharedStrings+xml");

    // workbook.xml
    xml::XMLStreamWriter workbook_writer;
    workbook_writer.startDocument();
    workbook_writer.startElement("workbook");
    workbook_writer.writeAttribute("xmlns", kMainNamespace);
    workbook_writer.writeAttribute("xmlns:r", kRelNamespace);
    if (package.date1904) {
        workbook_writer.startElement("workbookPr");
        workbook_writer.writeAttribute("date1904", "1");
        workbook_writer.endElement(); // workbookPr
    }
    workbook_writer.startElement("sheets");
    for (size_t i = 0; i < sheet_count; ++i) {
        workbook_writer.startElement("sheet");
        workbook_writer.writeAttribute("name", std::string_view(workbook_.getSheet(i)->getName()));
        workbook_writer.writeAttribute("sheetId", static_cast<int>(i + 1));
        workbook_writer.writeAttribute("r:id", std::string_view(fmt::format("rId{}", i + 1)));
        workbook_writer.endElement(); // sheet
    }
    workbook_writer.endElement(); // sheets
    workbook_writer.writeRaw(generateDefinedNames(workbook_.definedNames()));
    workbook_writer.endElement(); // workbook

    // [Content_Types].xml
    xml::XMLStreamWriter types_writer;
    types_writer.startDocument();
    types_writer.startElement("Types");
    types_writer.writeAttribute("xmlns", kContentTypesNamespace);
    types_writer.startElement("Default");
    types_writer.writeAttribute("Extension", "rels");
    types_writer.writeAttribute("ContentType", "application/vnd.openxmlformats-package.relationships+xml");
    types_writer.endElement(); // Default
    types_writer.startElement("Default");
    types_writer.writeAttribute("Extension", "xml");
    types_writer.writeAttribute("ContentType", "application/xml");
    types_writer.endElement(); // Default
    for (const auto& [part_name, content_type] : overrides) {
        types_writer.startElement("Override");
        types_writer.writeAttribute("PartName", std::string_view(part_name));
        types_writer.writeAttribute("ContentType", std::string_view(content_type));
        types_writer.endElement(); // Override
    }
    types_writer.endElement(); // Types

    std::vector<Part> parts;
    parts.emplace_back("[Content_Types].xml", types_writer.toString());
    parts.emplace_back("_rels/.rels", generateRelationships({{"rId1", "officeDocument", "xl/workbook.xml"}}));
    parts.emplace_back("xl/workbook.xml", workbook_writer.toString());
    parts.emplace_back("xl/_rels/workbook.xml.rels", generateRelationships(workbook_rels));
    parts.emplace_back("xl/styles.xml", styles.patchStyles(kTemplateStyles));
    for (auto& part : sheet_parts) {
        parts.push_back(std::move(part));
    }
    parts.emplace_back("xl/sharedStrings.xml", sst.generate());

    WRITER_DEBUG("Built template package: {} sheets, {} tables, {} shared strings",
                 sheet_count, table_number, sst.size());
    return parts;
}

// ========== 部件片段 ==========

std::string XLSXWriter::generateDefinedNames(const core::DefinedNameManager& names) {
    if (names.empty()) {
        return std::string();
    }

    xml::XMLStreamWriter writer;
    writer.startElement("definedNames");
    for (const auto& name : names.getAll()) {
        writer.startElement("definedName");
        writer.writeAttribute("name", std::string_view(name.name));
        if (name.local_sheet_id) {
            writer.writeAttribute("localSheetId", *name.local_sheet_id);
        }
        if (name.hidden) {
            writer.writeAttribute("hidden", "1");
        }
        writer.writeText(name.formula);
        writer.endElement(); // definedName
    }
    writer.endElement(); // definedNames
    return writer.toString();
}

std::string XLSXWriter::spliceDefinedNames(const std::string& workbook_xml, const std::string& defined_names) {
    std::string result = workbook_xml;

    const size_t start = result.find("<definedNames");
    if (start != std::string::npos) {
        const size_t tag_end = result.find('>', start);
        if (tag_end == std::string::npos) {
            XLSXEXTRACT_THROW(core::FormatException, "Unterminated definedNames element in workbook.xml");
        }
        size_t end = tag_end + 1;
        if (result[tag_end - 1] != '/') {
            const size_t close = result.find("</definedNames>", tag_end);
            if (close == std::string::npos) {
                XLSXEXTRACT_THROW(core::FormatException, "Unterminated definedNames element in workbook.xml");
            }
            end = close + std::strlen("</definedNames>");
        }
        result.erase(start, end - start);
    }

    if (defined_names.empty()) {
        return result;
    }

    // definedNames 位于 sheets / externalReferences 之后
    for (const char* anchor : {"</externalReferences>", "</sheets>"}) {
        const size_t pos = result.find(anchor);
        if (pos != std::string::npos) {
            result.insert(pos + std::strlen(anchor), defined_names);
            return result;
        }
    }
    XLSXEXTRACT_THROW(core::FormatException, "workbook.xml has no sheets element");
}

std::string XLSXWriter::generateTable(const core::Table& table, const core::Worksheet& worksheet, int id) {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("table");
    writer.writeAttribute("xmlns", kMainNamespace);
    writer.writeAttribute("id", id);
    writer.writeAttribute("name", std::string_view(table.name.empty() ? table.display_name : table.name));
    writer.writeAttribute("displayName", std::string_view(table.display_name));
    writer.writeAttribute("ref", std::string_view(table.ref()));
    if (table.header_row_count != 1) {
        writer.writeAttribute("headerRowCount", table.header_row_count);
    }
    if (table.totals_row_count > 0) {
        writer.writeAttribute("totalsRowCount", table.totals_row_count);
    }

    if (table.has_auto_filter && table.header_row_count > 0) {
        writer.startElement("autoFilter");
        writer.writeAttribute("ref", std::string_view(utils::AddressParser::formatRange(
            table.first_row, table.first_col, table.last_row - table.totals_row_count, table.last_col)));
        writer.endElement(); // autoFilter
    }

    // 列名必须唯一（不区分大小写）
    std::set<std::string> used;
    writer.startElement("tableColumns");
    writer.writeAttribute("count", table.columns());
    for (int c = 0; c < table.columns(); ++c) {
        std::string name = table.header_row_count > 0
            ? headerName(worksheet.getValue(table.first_row, table.first_col + c), c + 1)
            : fmt::format("Column{}", c + 1);
        std::string unique = name;
        for (int suffix = 2; used.count(utils::CommonUtils::toLower(unique)); ++suffix) {
            unique = fmt::format("{}{}", name, suffix);
        }
        used.insert(utils::CommonUtils::toLower(unique));

        writer.startElement("tableColumn");
        writer.writeAttribute("id", c + 1);
        writer.writeAttribute("name", std::string_view(unique));
        writer.endElement(); // tableColumn
    }
    writer.endElement(); // tableColumns

    if (!table.style_info.empty()) {
        writer.startElement("tableStyleInfo");
        for (const auto& [name, value] : table.style_info) {
            writer.writeAttribute(name, std::string_view(value));
        }
        writer.endElement(); // tableStyleInfo
    }

    writer.endElement(); // table
    return writer.toString();
}

}} // namespace xlsxextract::writer
