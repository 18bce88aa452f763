#pragma once

#include "xlsxextract/reader/BaseSAXParser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace xlsxextract {
namespace reader {

/**
 * @brief 解析 .rels 关系部件
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;
        std::string type;
        std::string target;
        bool external = false;
    };

    const Relationship* findById(const std::string& id) const;

    /**
     * @brief 按类型后缀查找（如 "/worksheet"、"/sharedStrings"）
     */
    std::vector<const Relationship*> findByType(std::string_view type_suffix) const;

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    /**
     * @brief 把关系目标解析为包内绝对路径
     * @param source_dir 关系所属部件所在目录，例如 "xl/"
     *
     * 以 "/" 开头的目标相对包根；其余相对 source_dir，支持 ".."。
     */
    static std::string resolveTarget(const std::string& source_dir, const std::string& target);

    /**
     * @brief 部件对应的 .rels 路径：xl/workbook.xml -> xl/_rels/workbook.xml.rels
     */
    static std::string relsPathFor(const std::string& part_path);

    /**
     * @brief 部件所在目录（带结尾 "/"）
     */
    static std::string directoryOf(const std::string& part_path);

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                        int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

private:
    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;
};

}} // namespace xlsxextract::reader
