#include "xlsxextract/reader/RelationshipsParser.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"

namespace xlsxextract {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                                         int /*depth*/) {
    if (localName(name) != "Relationship") {
        return;
    }

    auto id = findAttribute(attributes, "Id");
    auto type = findAttribute(attributes, "Type");
    auto target = findAttribute(attributes, "Target");
    if (!id || !type || !target || id->empty() || target->empty()) {
        READER_WARN("Skipping incomplete relationship: id='{}', target='{}'",
                    id ? *id : "", target ? *target : "");
        return;
    }

    Relationship rel;
    rel.id = *id;
    rel.type = *type;
    rel.target = *target;
    rel.external = getAttributeOr(attributes, "TargetMode", "Internal") == "External";

    id_index_[rel.id] = relationships_.size();
    relationships_.push_back(std::move(rel));
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    return it != id_index_.end() ? &relationships_[it->second] : nullptr;
}

std::vector<const RelationshipsParser::Relationship*> RelationshipsParser::findByType(
        std::string_view type_suffix) const {
    std::vector<const Relationship*> result;
    for (const auto& rel : relationships_) {
        if (rel.type.size() >= type_suffix.size() &&
            rel.type.compare(rel.type.size() - type_suffix.size(), type_suffix.size(), type_suffix) == 0) {
            result.push_back(&rel);
        }
    }
    return result;
}

std::string RelationshipsParser::resolveTarget(const std::string& source_dir, const std::string& target) {
    std::string joined = (!target.empty() && target.front() == '/') ? target.substr(1) : source_dir + target;

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= joined.size()) {
        size_t slash = joined.find('/', start);
        if (slash == std::string::npos) {
            slash = joined.size();
        }
        std::string segment = joined.substr(start, slash - start);
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(std::move(segment));
        }
        start = slash + 1;
    }

    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += segments[i];
    }
    return result;
}

std::string RelationshipsParser::relsPathFor(const std::string& part_path) {
    const size_t slash = part_path.rfind('/');
    if (slash == std::string::npos) {
        return "_rels/" + part_path + ".rels";
    }
    return part_path.substr(0, slash + 1) + "_rels/" + part_path.substr(slash + 1) + ".rels";
}

std::string RelationshipsParser::directoryOf(const std::string& part_path) {
    const size_t slash = part_path.rfind('/');
    return slash == std::string::npos ? std::string() : part_path.substr(0, slash + 1);
}

}} // namespace xlsxextract::reader
