#include "xlsxextract/xml/XMLStreamWriter.hpp"
#include "xlsxextract/core/Exception.hpp"
#include <fmt/format.h>

namespace xlsxextract {
namespace xml {

namespace {

// XML 1.0 不允许的控制字符
bool isForbiddenControl(unsigned char c) {
    return c < 0x20 && c != '\t' && c != '\n' && c != '\r';
}

} // namespace

std::string XMLStreamWriter::escapeText(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:
                if (!isForbiddenControl(static_cast<unsigned char>(ch))) {
                    out += ch;
                }
                break;
        }
    }
    return out;
}

std::string XMLStreamWriter::escapeAttribute(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\n': out += "&#xA;"; break;
            default:
                if (!isForbiddenControl(static_cast<unsigned char>(ch))) {
                    out += ch;
                }
                break;
        }
    }
    return out;
}

void XMLStreamWriter::startDocument() {
    buffer_ += "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
}

void XMLStreamWriter::ensureElementClosed() {
    if (!in_element_) {
        return;
    }
    for (const auto& attr : pending_attributes_) {
        buffer_ += ' ';
        buffer_ += attr.key;
        buffer_ += "=\"";
        buffer_ += attr.value;
        buffer_ += '"';
    }
    pending_attributes_.clear();
    buffer_ += self_closing_ ? "/>" : ">";
    in_element_ = false;
    self_closing_ = false;
}

void XMLStreamWriter::startElement(const std::string& name) {
    ensureElementClosed();
    buffer_ += '<';
    buffer_ += name;
    element_stack_.push_back(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        XLSXEXTRACT_THROW(core::OperationException, "endElement without matching startElement");
    }
    if (in_element_) {
        // 没有内容的元素写成自闭合
        self_closing_ = true;
        ensureElementClosed();
    } else {
        buffer_ += "</";
        buffer_ += element_stack_.back();
        buffer_ += '>';
    }
    element_stack_.pop_back();
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    if (!in_element_) {
        XLSXEXTRACT_THROW(core::OperationException,
                          fmt::format("attribute {} written outside a start tag", name));
    }
    pending_attributes_.emplace_back(name, escapeAttribute(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeAttribute(const std::string& name, double value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeText(std::string_view text) {
    ensureElementClosed();
    buffer_ += escapeText(text);
}

void XMLStreamWriter::writeText(double value) {
    ensureElementClosed();
    buffer_ += fmt::format("{}", value);
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_.append(data.data(), data.size());
}

std::string XMLStreamWriter::toString() {
    while (!element_stack_.empty()) {
        endElement();
    }
    return buffer_;
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    element_stack_.clear();
    pending_attributes_.clear();
    in_element_ = false;
    self_closing_ = false;
}

}} // namespace xlsxextract::xml
