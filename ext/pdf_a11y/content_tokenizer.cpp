#include "content_tokenizer.hpp"

#include <cstring>

namespace pdf_a11y {

char const* token_kind_name(TokenKind kind) {
  // Do this is a case statement instead of a lookup so the compiler
  // will warn if we miss any.
  switch (kind) {
    case TokenKind::Whitespace:
      return "whitespace";
    case TokenKind::Comment:
      return "comment";
    case TokenKind::LiteralString:
      return "string";
    case TokenKind::HexString:
      return "hexstring";
    case TokenKind::Dict:
      return "dict";
    case TokenKind::Array:
      return "array";
    case TokenKind::Name:
      return "name";
    case TokenKind::Number:
      return "number";
    case TokenKind::Operator:
      return "operator";
    case TokenKind::InlineImage:
      return "inline-image";
    case TokenKind::Other:
      return "other";
  }
  return nullptr;
}

bool is_pdf_whitespace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\0'; }

bool is_pdf_delimiter(char c) { return c != '\0' && std::strchr("/<>[]()%{}", c) != nullptr; }

static bool is_regular(char c) { return !is_pdf_whitespace(c) && !is_pdf_delimiter(c); }

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

TokenList ContentTokenizer::tokenize(std::string const& data) {
  TokenList tokens;
  ContentTokenizer tokenizer(data);
  tokenizer.run(tokens);
  return tokens;
}

// Returns the index one past the closing paren, or data.size() when unterminated.
size_t ContentTokenizer::scan_literal_string(size_t start) const {
  int depth = 1;
  size_t j = start + 1;
  while (j < data.size() && depth > 0) {
    char c = data[j];
    if (c == '\\' && j + 1 < data.size()) {
      j += 2;
      continue;
    }
    if (c == '(') {
      ++depth;
    } else if (c == ')') {
      --depth;
    }
    ++j;
  }
  return j;
}

size_t ContentTokenizer::scan_hex_string(size_t start) const {
  size_t end = data.find('>', start + 1);
  return end == std::string::npos ? data.size() : end + 1;
}

size_t ContentTokenizer::scan_dict(size_t start) const {
  int depth = 1;
  size_t j = start + 2;
  while (j < data.size() && depth > 0) {
    char c = data[j];
    if (c == '(') {
      j = scan_literal_string(j);
    } else if (c == '<' && j + 1 < data.size() && data[j + 1] == '<') {
      ++depth;
      j += 2;
    } else if (c == '>' && j + 1 < data.size() && data[j + 1] == '>') {
      --depth;
      j += 2;
    } else if (c == '<') {
      j = scan_hex_string(j);
    } else {
      ++j;
    }
  }
  return j;
}

size_t ContentTokenizer::scan_array(size_t start) const {
  int depth = 1;
  size_t j = start + 1;
  while (j < data.size() && depth > 0) {
    char c = data[j];
    if (c == '[') {
      ++depth;
      ++j;
    } else if (c == ']') {
      --depth;
      ++j;
    } else if (c == '(') {
      j = scan_literal_string(j);
    } else if (c == '<' && (j + 1 >= data.size() || data[j + 1] != '<')) {
      j = scan_hex_string(j);
    } else {
      ++j;
    }
  }
  return j;
}

size_t ContentTokenizer::scan_regular(size_t start) const {
  size_t j = start;
  while (j < data.size() && is_regular(data[j])) ++j;
  return j;
}

// Inline image data ends before an EI that follows whitespace and is itself
// followed by whitespace, a delimiter or the end of the stream. Returns the
// index of that whitespace, or data.size() when no EI is found.
size_t ContentTokenizer::scan_inline_image(size_t start) const {
  size_t j = data.find("EI", start);
  while (j != std::string::npos) {
    bool after_ok = j + 2 >= data.size() || is_pdf_whitespace(data[j + 2]) || is_pdf_delimiter(data[j + 2]);
    if (j > 0 && is_pdf_whitespace(data[j - 1]) && after_ok) return j > start ? j - 1 : start;
    j = data.find("EI", j + 1);
  }
  return data.size();
}

void ContentTokenizer::run(TokenList& out) {
  size_t const n = data.size();
  while (pos < n) {
    char c = data[pos];

    if (is_pdf_whitespace(c)) {
      out.emplace_back(std::string(1, c), TokenKind::Whitespace);
      ++pos;
      continue;
    }

    if (c == '%') {
      size_t end = data.find_first_of("\r\n", pos);
      if (end == std::string::npos) end = n;
      out.emplace_back(data.substr(pos, end - pos), TokenKind::Comment);
      pos = end;
      continue;
    }

    size_t end = pos;
    TokenKind kind = TokenKind::Other;

    if (c == '(') {
      end = scan_literal_string(pos);
      kind = TokenKind::LiteralString;
    } else if (c == '<' && pos + 1 < n && data[pos + 1] == '<') {
      end = scan_dict(pos);
      kind = TokenKind::Dict;
    } else if (c == '<') {
      end = scan_hex_string(pos);
      kind = TokenKind::HexString;
    } else if (c == '[') {
      end = scan_array(pos);
      kind = TokenKind::Array;
    } else if (c == '/') {
      end = scan_regular(pos + 1);
      kind = TokenKind::Name;
    } else if (is_regular(c)) {
      end = scan_regular(pos);
      kind = TokenKind::Operator;

      // A number is an optional sign, digits and at most one decimal point.
      // Anything else in the run (a second '.', letters) leaves it an operator.
      if (is_digit(c) || c == '+' || c == '-' || c == '.') {
        bool seen_dot = false;
        bool seen_digit = false;
        bool numeric = true;
        for (size_t j = pos; j < end && numeric; ++j) {
          char d = data[j];
          if (is_digit(d)) {
            seen_digit = true;
          } else if (d == '.') {
            numeric = !seen_dot;
            seen_dot = true;
          } else if ((d == '+' || d == '-') && j == pos) {
            // leading sign
          } else {
            numeric = false;
          }
        }
        if (numeric && seen_digit) kind = TokenKind::Number;
      }
    } else {
      end = pos + 1;
    }

    out.emplace_back(data.substr(pos, end - pos), kind);
    pos = end;

    if (kind == TokenKind::Operator && out.back().value == "ID") {
      // one whitespace byte separates ID from the image data
      if (pos < n && is_pdf_whitespace(data[pos])) {
        out.emplace_back(std::string(1, data[pos]), TokenKind::Whitespace);
        ++pos;
      }
      end = scan_inline_image(pos);
      if (end > pos) out.emplace_back(data.substr(pos, end - pos), TokenKind::InlineImage);
      pos = end;
    }
  }
}

std::string reassemble(TokenList const& tokens) {
  size_t size = 0;
  for (auto const& t : tokens) size += t.value.size();

  std::string result;
  result.reserve(size);
  for (auto const& t : tokens) result += t.value;
  return result;
}

}  // namespace pdf_a11y
