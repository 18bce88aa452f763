#include "xlsxextract/reader/SharedStringsParser.hpp"

namespace xlsxextract {
namespace reader {

void SharedStringsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& /*attributes*/,
                                         int /*depth*/) {
    const std::string_view local = localName(name);
    if (local == "si") {
        in_item_ = true;
        current_.clear();
    } else if (local == "rPh") {
        ++phonetic_depth_;
    } else if (local == "t" && in_item_ && phonetic_depth_ == 0) {
        in_text_ = true;
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    const std::string_view local = localName(name);
    if (local == "si") {
        strings_.push_back(std::move(current_));
        current_.clear();
        in_item_ = false;
    } else if (local == "rPh") {
        --phonetic_depth_;
    } else if (local == "t") {
        in_text_ = false;
    }
}

void SharedStringsParser::onText(std::string_view text, int /*depth*/) {
    if (in_text_) {
        current_.append(text.data(), text.size());
    }
}

}} // namespace xlsxextract::reader
