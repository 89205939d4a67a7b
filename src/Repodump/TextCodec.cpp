// =================================================================
// src/Repodump/TextCodec.cpp
// =================================================================
// Implementation for text decoding and encoding.

#include "Repodump/TextCodec.hpp"
#include "Repodump/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace Repodump {

const char* const TextCodec::kReplacement = "\xEF\xBF\xBD";

namespace {

void appendCodePoint(std::string& out, unsigned int code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

unsigned int decodeSequence(const std::string& text, size_t pos, size_t length) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    if (length == 1) {
        return lead;
    }
    unsigned int code_point = lead & (0xFF >> (length + 1));
    for (size_t i = 1; i < length; ++i) {
        code_point = (code_point << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
    }
    return code_point;
}

} // namespace

TextEncoding TextCodec::parseEncoding(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    lowered.erase(std::remove(lowered.begin(), lowered.end(), '_'), lowered.end());
    lowered.erase(std::remove(lowered.begin(), lowered.end(), '-'), lowered.end());

    if (lowered == "utf8") {
        return TextEncoding::Utf8;
    }
    if (lowered == "latin1" || lowered == "iso88591" || lowered == "l1") {
        return TextEncoding::Latin1;
    }
    if (lowered == "ascii" || lowered == "usascii") {
        return TextEncoding::Ascii;
    }
    throw ConfigError("unsupported encoding '" + name + "' (expected utf-8, latin-1 or ascii)");
}

std::string TextCodec::encodingName(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8: return "utf-8";
        case TextEncoding::Latin1: return "latin-1";
        case TextEncoding::Ascii: return "ascii";
        default: return "unknown";
    }
}

TextCodec::TextCodec(TextEncoding encoding) : m_encoding(encoding) {}

DecodedText TextCodec::decode(const std::string& bytes) const {
    DecodedText result;
    switch (m_encoding) {
        case TextEncoding::Utf8:
            return decodeUtf8(bytes);

        case TextEncoding::Latin1:
            // Every byte is a valid code point
            result.text.reserve(bytes.size());
            for (char c : bytes) {
                appendCodePoint(result.text, static_cast<unsigned char>(c));
            }
            return result;

        case TextEncoding::Ascii:
            result.text.reserve(bytes.size());
            for (char c : bytes) {
                if (static_cast<unsigned char>(c) < 0x80) {
                    result.text += c;
                } else {
                    result.text += kReplacement;
                    result.lossy = true;
                }
            }
            return result;
    }
    return decodeUtf8(bytes);
}

DecodedText TextCodec::decodeUtf8(const std::string& bytes) const {
    DecodedText result;
    result.text.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t length = utf8SequenceLength(bytes, pos);
        if (length == 0) {
            result.text += kReplacement;
            result.lossy = true;
            ++pos;
            continue;
        }
        result.text.append(bytes, pos, length);
        pos += length;
    }
    return result;
}

std::string TextCodec::encode(const std::string& utf8_text) const {
    if (m_encoding == TextEncoding::Utf8) {
        return utf8_text;
    }

    const unsigned int limit = (m_encoding == TextEncoding::Latin1) ? 0xFF : 0x7F;
    std::string encoded;
    encoded.reserve(utf8_text.size());

    size_t pos = 0;
    while (pos < utf8_text.size()) {
        size_t length = utf8SequenceLength(utf8_text, pos);
        if (length == 0) {
            encoded += '?';
            ++pos;
            continue;
        }
        unsigned int code_point = decodeSequence(utf8_text, pos, length);
        encoded += (code_point <= limit) ? static_cast<char>(code_point) : '?';
        pos += length;
    }
    return encoded;
}

size_t TextCodec::utf8SequenceLength(const std::string& bytes, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(bytes[pos]);
    size_t length;
    unsigned int min_code_point;
    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        min_code_point = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        min_code_point = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        min_code_point = 0x10000;
    } else {
        return 0;
    }

    if (pos + length > bytes.size()) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        if ((static_cast<unsigned char>(bytes[pos + i]) & 0xC0) != 0x80) {
            return 0;
        }
    }

    unsigned int code_point = decodeSequence(bytes, pos, length);
    if (code_point < min_code_point || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return 0;
    }
    return length;
}

size_t TextCodec::utf8Boundary(const std::string& text, size_t max_length) {
    if (max_length >= text.size()) {
        return text.size();
    }
    size_t boundary = max_length;
    // Step back over continuation bytes
    while (boundary > 0 && (static_cast<unsigned char>(text[boundary]) & 0xC0) == 0x80) {
        --boundary;
    }
    return boundary;
}

} // namespace Repodump
