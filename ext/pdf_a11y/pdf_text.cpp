#include "pdf_text.hpp"

#include "content_tokenizer.hpp"

#include <qpdf/QUtil.hh>

#include <cctype>

namespace pdf_a11y {

static bool is_octal(char c) { return c >= '0' && c <= '7'; }

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string decode_literal_string(std::string const& token) {
  if (token.size() < 2 || token.front() != '(') return "";

  // unterminated strings (tokenizer ran to end of input) have no closing paren
  size_t end = token.back() == ')' ? token.size() - 1 : token.size();
  std::string out;
  out.reserve(end);

  for (size_t i = 1; i < end; ++i) {
    char c = token[i];
    if (c != '\\' || i + 1 >= end) {
      out += c;
      continue;
    }

    char e = token[++i];
    switch (e) {
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case '\r':
        // line continuation, swallow an optional LF too
        if (i + 1 < end && token[i + 1] == '\n') ++i;
        break;
      case '\n':
        break;
      default:
        if (is_octal(e)) {
          int value = e - '0';
          for (int k = 0; k < 2 && i + 1 < end && is_octal(token[i + 1]); ++k) {
            value = value * 8 + (token[++i] - '0');
          }
          out += static_cast<char>(value & 0xff);
        } else {
          // \( \) \\ and unknown escapes all yield the character itself
          out += e;
        }
    }
  }
  return out;
}

std::string decode_hex_string(std::string const& token) {
  if (token.empty() || token.front() != '<') return "";

  std::string out;
  int high = -1;
  for (size_t i = 1; i < token.size() && token[i] != '>'; ++i) {
    int v = hex_value(token[i]);
    if (v < 0) continue;
    if (high < 0) {
      high = v;
    } else {
      out += static_cast<char>((high << 4) | v);
      high = -1;
    }
  }
  if (high >= 0) out += static_cast<char>(high << 4);
  return out;
}

std::string pdf_bytes_to_utf8(std::string const& bytes) {
  if (QUtil::is_utf16(bytes)) return QUtil::utf16_to_utf8(bytes);

  std::string out;
  out.reserve(bytes.size());
  for (unsigned char c : bytes) out += QUtil::toUTF8(c);
  return out;
}

std::string string_token_text(std::string const& token) {
  if (token.empty()) return "";
  if (token.front() == '(') return pdf_bytes_to_utf8(decode_literal_string(token));
  if (token.front() == '<' && (token.size() < 2 || token[1] != '<')) {
    return pdf_bytes_to_utf8(decode_hex_string(token));
  }
  return "";
}

std::string array_token_text(std::string const& token) {
  if (token.empty() || token.front() != '[') return "";

  size_t end = token.back() == ']' ? token.size() - 1 : token.size();
  std::string inner = token.substr(1, end - 1);

  std::string text;
  for (auto const& t : ContentTokenizer::tokenize(inner)) {
    if (t.is(TokenKind::LiteralString) || t.is(TokenKind::HexString)) {
      text += string_token_text(t.value);
    }
  }
  return text;
}

QPDFObjectHandle make_text_string(std::string const& utf8) {
  return QPDFObjectHandle::newUnicodeString(utf8);
}

std::string text_string_value(QPDFObjectHandle value) {
  if (!value.isString()) return "";
  return value.getUTF8Value();
}

std::string to_lower_ascii(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string truncate_text(std::string const& s, size_t max_len) {
  if (s.size() <= max_len) return s;

  // back up to the start of a UTF-8 sequence
  size_t cut = max_len;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xc0) == 0x80) --cut;
  return s.substr(0, cut) + "...";
}

}  // namespace pdf_a11y
