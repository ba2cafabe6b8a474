#pragma once

#include <string>
#include <vector>

namespace pdf_a11y {

enum class TokenKind {
  Whitespace,
  Comment,
  LiteralString,
  HexString,
  Dict,
  Array,
  Name,
  Number,
  Operator,
  InlineImage,  // raw bytes between ID and EI
  Other
};

char const* token_kind_name(TokenKind kind);

struct Token {
  std::string value;
  TokenKind kind;

  Token(std::string v, TokenKind k) : value(std::move(v)), kind(k) {}

  bool is(TokenKind k) const { return kind == k; }
  bool is_operator(char const* op) const { return kind == TokenKind::Operator && value == op; }
};

using TokenList = std::vector<Token>;

/**
 * Lossless tokenizer for page content streams.
 *
 * Strings, dictionaries and arrays are kept as single tokens so an editor can
 * splice around operand/operator pairs without re-serializing anything.
 * Whitespace and comments survive as their own tokens, and the binary data of
 * an inline image is one opaque token:
 *
 *   reassemble(ContentTokenizer::tokenize(bytes)) == bytes
 */
class ContentTokenizer {
 public:
  static TokenList tokenize(std::string const& data);

 private:
  explicit ContentTokenizer(std::string const& data) : data(data), pos(0) {}

  void run(TokenList& out);
  size_t scan_literal_string(size_t start) const;
  size_t scan_hex_string(size_t start) const;
  size_t scan_dict(size_t start) const;
  size_t scan_array(size_t start) const;
  size_t scan_regular(size_t start) const;
  size_t scan_inline_image(size_t start) const;

  std::string const& data;
  size_t pos;
};

std::string reassemble(TokenList const& tokens);

bool is_pdf_whitespace(char c);
bool is_pdf_delimiter(char c);

}  // namespace pdf_a11y
