// =================================================================
// include/Repodump/TextCodec.hpp
// =================================================================
// Header for decoding file bytes into UTF-8 text and encoding dumps.

#pragma once

#include <string>

namespace Repodump {

/**
 * @brief Text encodings understood for input decoding and output encoding
 */
enum class TextEncoding {
    Utf8,
    Latin1,
    Ascii
};

/**
 * @brief Result of decoding raw bytes
 */
struct DecodedText {
    std::string text;   ///< UTF-8 text
    bool lossy = false; ///< true if replacement characters were substituted
};

/**
 * @brief Converts between raw bytes and the UTF-8 text held in records
 */
class TextCodec {
public:
    /// U+FFFD REPLACEMENT CHARACTER in UTF-8
    static const char* const kReplacement;

    /**
     * @brief Parse an encoding name (utf-8, latin-1, ascii and common aliases)
     * @param name Encoding name, case-insensitive
     * @return Parsed encoding
     * @throws ConfigError for unknown names
     */
    static TextEncoding parseEncoding(const std::string& name);

    static std::string encodingName(TextEncoding encoding);

    explicit TextCodec(TextEncoding encoding = TextEncoding::Utf8);

    /**
     * @brief Decode raw bytes to UTF-8
     *
     * Invalid sequences are replaced with U+FFFD instead of failing.
     */
    DecodedText decode(const std::string& bytes) const;

    /**
     * @brief Encode UTF-8 text into the configured encoding
     *
     * Characters the encoding cannot represent become '?'.
     */
    std::string encode(const std::string& utf8_text) const;

    TextEncoding encoding() const { return m_encoding; }

    /**
     * @brief Length of the valid UTF-8 sequence starting at pos, or 0 if invalid
     */
    static size_t utf8SequenceLength(const std::string& bytes, size_t pos);

    /**
     * @brief Largest length <= max_length that does not split a UTF-8 sequence
     */
    static size_t utf8Boundary(const std::string& text, size_t max_length);

private:
    TextEncoding m_encoding;

    DecodedText decodeUtf8(const std::string& bytes) const;
};

} // namespace Repodump
