#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <qpdf/QPDFObjectHandle.hh>

#include <string>

namespace pdf_a11y {

// ---- decoding (content-stream tokens -> bytes -> UTF-8) -----------------

/** Unescapes a "( ... )" token: \n \r \t \b \f \( \) \\, octal \ddd and line continuations. */
std::string decode_literal_string(std::string const& token);

/** Decodes a "< ... >" token. Whitespace is ignored, an odd trailing nibble is padded with 0. */
std::string decode_hex_string(std::string const& token);

/** PDF string bytes to UTF-8: UTF-16BE when the bytes start with a FE FF mark, Latin-1 otherwise. */
std::string pdf_bytes_to_utf8(std::string const& bytes);

/** Text of a literal or hex string token, "" for anything else. */
std::string string_token_text(std::string const& token);

/** Concatenated text of every string element in a TJ array token. */
std::string array_token_text(std::string const& token);

// ---- encoding (UTF-8 -> PDF) ---------------------------------------------

/**
 * A string object for /Alt, /ActualText, /Lang, /Title values: PDFDocEncoding
 * when every character has a code there, otherwise UTF-16BE with a FE FF mark.
 */
QPDFObjectHandle make_text_string(std::string const& utf8);

/** UTF-8 value of a string object, "" when the object is not a string. */
std::string text_string_value(QPDFObjectHandle value);

std::string to_lower_ascii(std::string s);
std::string truncate_text(std::string const& s, size_t max_len);

}  // namespace pdf_a11y
