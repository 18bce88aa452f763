#include "xlsxextract/xml/XMLStreamReader.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <climits>
#include <cstring>
#include <fmt/format.h>

namespace xlsxextract {
namespace xml {

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        last_error_ = XMLParseError::ParserCreateFailed;
        last_error_message_ = "Failed to create XML parser";
        XML_ERROR("{}", last_error_message_);
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attributes_.clear();
    current_text_.clear();
    elements_parsed_ = 0;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();
    if (!buffer || size == 0) {
        last_error_ = XMLParseError::InvalidInput;
        last_error_message_ = "Empty XML content";
        return last_error_;
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        last_error_ = XMLParseError::MemoryError;
        last_error_message_ = fmt::format("XML content too large: {} bytes", size);
        return last_error_;
    }
    if (!initializeParser()) {
        return last_error_;
    }

    if (XML_Parse(parser_, buffer, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        // 回调出错时已记录了更具体的信息
        if (last_error_ == XMLParseError::Ok) {
            last_error_ = XMLParseError::ParseFailed;
            last_error_message_ = fmt::format("Parse error at line {}, column {}: {}",
                                              XML_GetCurrentLineNumber(parser_),
                                              XML_GetCurrentColumnNumber(parser_),
                                              XML_ErrorString(XML_GetErrorCode(parser_)));
        }
        XML_DEBUG("{}", last_error_message_);
        cleanupParser();
        return last_error_;
    }

    cleanupParser();
    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return XMLParseError::Ok;
}

void XMLStreamReader::handleCallbackError(const char* where, const std::exception& e) {
    last_error_ = XMLParseError::CallbackError;
    last_error_message_ = fmt::format("{} callback error at line {}: {}", where,
                                      XML_GetCurrentLineNumber(parser_), e.what());
    XML_StopParser(parser_, XML_FALSE);
}

void XMLCALL XMLStreamReader::startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    reader->elements_parsed_++;

    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i] && attrs[i + 1]; i += 2) {
            reader->attributes_.emplace_back(std::string_view{attrs[i], std::strlen(attrs[i])},
                                             std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
        }
    }

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(std::string_view{name, std::strlen(name)},
                                            reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleCallbackError("Start element", e);
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::endElementHandler(void* user_data, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    reader->current_depth_--;

    try {
        if (!reader->current_text_.empty() && reader->text_callback_) {
            std::string_view text{reader->current_text_};
            if (!text.empty()) {
                reader->text_callback_(text, reader->current_depth_);
            }
        }
        if (reader->end_element_callback_) {
            reader->end_element_callback_(std::string_view{name, std::strlen(name)}, reader->current_depth_);
        }
    } catch (const std::exception& e) {
        reader->handleCallbackError("End element", e);
    }

    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::characterDataHandler(void* user_data, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

}} // namespace xlsxextract::xml
