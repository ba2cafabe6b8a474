#include "token_editor.hpp"
#include "pdf_text.hpp"

#include <qpdf/QUtil.hh>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace pdf_a11y {

static constexpr char const* COLOR_OPERATORS[] = {"rg", "RG", "scn", "SCN"};

static double number_value(Token const& t) { return std::strtod(t.value.c_str(), nullptr); }

// Index of the nearest non-whitespace token before index, or npos.
static size_t previous_significant(TokenList const& tokens, size_t index) {
  while (index > 0) {
    --index;
    if (!tokens[index].is(TokenKind::Whitespace)) return index;
  }
  return std::string::npos;
}

std::vector<size_t> preceding_numbers(TokenList const& tokens, size_t op_index, size_t max_count) {
  std::vector<size_t> found;
  size_t j = op_index;
  while (found.size() < max_count) {
    j = previous_significant(tokens, j);
    if (j == std::string::npos || !tokens[j].is(TokenKind::Number)) break;
    found.push_back(j);
  }
  std::reverse(found.begin(), found.end());
  return found;
}

std::vector<TextSpan> find_text_spans(TokenList const& tokens, std::string const& target) {
  std::vector<TextSpan> matches;
  if (target.empty()) return matches;

  std::string const needle = to_lower_ascii(target);

  for (size_t i = 0; i < tokens.size(); ++i) {
    Token const& tok = tokens[i];
    if (!tok.is(TokenKind::Operator)) continue;

    bool single = tok.value == "Tj" || tok.value == "'" || tok.value == "\"";
    bool array = tok.value == "TJ";
    if (!single && !array) continue;

    size_t j = previous_significant(tokens, i);
    if (j == std::string::npos) continue;

    Token const& operand = tokens[j];
    std::string text;
    if (single && (operand.is(TokenKind::LiteralString) || operand.is(TokenKind::HexString))) {
      text = string_token_text(operand.value);
    } else if (array && operand.is(TokenKind::Array)) {
      text = array_token_text(operand.value);
    } else {
      continue;
    }

    if (to_lower_ascii(text).find(needle) != std::string::npos) matches.emplace_back(j, i);
  }
  return matches;
}

BBox flip_bbox(BBox const& bbox, double page_height) {
  return {bbox[0], page_height - bbox[3], bbox[2], page_height - bbox[1]};
}

static bool inside(double x, double y, BBox const& b, double tol) {
  return x >= b[0] - tol && x <= b[2] + tol && y >= b[1] - tol && y <= b[3] + tol;
}

static bool block_in_bbox(TokenList const& tokens, size_t bt, size_t et, BBox const& bbox, double tol) {
  bool has_tm = false;
  double abs_x = 0.0;
  double abs_y = 0.0;
  bool has_td = false;

  for (size_t i = bt + 1; i < et; ++i) {
    Token const& t = tokens[i];
    if (!t.is(TokenKind::Operator)) continue;

    if (t.value == "Tm") {
      auto nums = preceding_numbers(tokens, i, 6);
      if (nums.size() != 6) continue;
      has_tm = true;
      if (inside(number_value(tokens[nums[4]]), number_value(tokens[nums[5]]), bbox, tol)) return true;
    } else if (t.value == "Td" || t.value == "TD") {
      auto nums = preceding_numbers(tokens, i, 2);
      if (nums.size() != 2) continue;
      has_td = true;
      abs_x += number_value(tokens[nums[0]]);
      abs_y += number_value(tokens[nums[1]]);
    }
  }

  // a Tm gives the definitive position; Td offsets only count without one
  return !has_tm && has_td && inside(abs_x, abs_y, bbox, tol);
}

std::optional<TextSpan> find_text_block_in_bbox(TokenList const& tokens, BBox const& pdf_bbox, double tolerance) {
  std::optional<TextSpan> run;

  size_t i = 0;
  while (i < tokens.size()) {
    if (!tokens[i].is_operator("BT")) {
      ++i;
      continue;
    }

    size_t et = i + 1;
    while (et < tokens.size() && !tokens[et].is_operator("ET")) ++et;
    if (et >= tokens.size()) break;

    if (block_in_bbox(tokens, i, et, pdf_bbox, tolerance)) {
      if (run) {
        run->second = et;
      } else {
        run = TextSpan(i, et);
      }
    } else if (run) {
      break;
    }
    i = et + 1;
  }
  return run;
}

int next_mcid(TokenList const& tokens) {
  static std::regex const mcid_re(R"(/MCID\s+(\d+))", std::regex::ECMAScript | std::regex::optimize);

  int next = 0;
  for (auto const& t : tokens) {
    if (!t.is(TokenKind::Dict)) continue;
    for (std::sregex_iterator it(t.value.begin(), t.value.end(), mcid_re), end; it != end; ++it) {
      next = std::max(next, QUtil::string_to_int((*it)[1].str().c_str()) + 1);
    }
  }
  return next;
}

TokenList inject_marked_content(TokenList const& tokens, TextSpan span, int mcid, std::string const& tag) {
  TokenList result;
  result.reserve(tokens.size() + 9);

  result.insert(result.end(), tokens.begin(), tokens.begin() + static_cast<long>(span.first));

  result.emplace_back("/" + tag, TokenKind::Name);
  result.emplace_back(" ", TokenKind::Whitespace);
  result.emplace_back("<</MCID " + std::to_string(mcid) + ">>", TokenKind::Dict);
  result.emplace_back(" ", TokenKind::Whitespace);
  result.emplace_back("BDC", TokenKind::Operator);
  result.emplace_back("\n", TokenKind::Whitespace);

  result.insert(result.end(), tokens.begin() + static_cast<long>(span.first),
                tokens.begin() + static_cast<long>(span.second) + 1);

  result.emplace_back("\n", TokenKind::Whitespace);
  result.emplace_back("EMC", TokenKind::Operator);
  result.emplace_back("\n", TokenKind::Whitespace);

  result.insert(result.end(), tokens.begin() + static_cast<long>(span.second) + 1, tokens.end());
  return result;
}

std::optional<RGB> hex_to_rgb(std::string const& hex) {
  static std::regex const hex_re("#([0-9A-Fa-f]{2})([0-9A-Fa-f]{2})([0-9A-Fa-f]{2})");

  std::smatch m;
  if (!std::regex_match(hex, m, hex_re)) return std::nullopt;

  auto channel = [&](int i) { return std::strtol(m[i].str().c_str(), nullptr, 16) / 255.0; };
  return RGB{channel(1), channel(2), channel(3)};
}

size_t replace_color(TokenList& tokens, RGB const& original, RGB const& fixed, double tolerance) {
  size_t replaced = 0;

  for (size_t i = 0; i < tokens.size(); ++i) {
    Token const& tok = tokens[i];
    if (!tok.is(TokenKind::Operator)) continue;
    if (std::none_of(std::begin(COLOR_OPERATORS), std::end(COLOR_OPERATORS),
                     [&](char const* op) { return tok.value == op; })) {
      continue;
    }

    // a fourth number means CMYK or a pattern tint, not an RGB triple
    auto nums = preceding_numbers(tokens, i, 4);
    if (nums.size() != 3) continue;

    double r = number_value(tokens[nums[0]]);
    double g = number_value(tokens[nums[1]]);
    double b = number_value(tokens[nums[2]]);

    if (std::fabs(r - original.r) < tolerance && std::fabs(g - original.g) < tolerance &&
        std::fabs(b - original.b) < tolerance) {
      tokens[nums[0]].value = QUtil::double_to_string(fixed.r, 4, false);
      tokens[nums[1]].value = QUtil::double_to_string(fixed.g, 4, false);
      tokens[nums[2]].value = QUtil::double_to_string(fixed.b, 4, false);
      ++replaced;
    }
  }
  return replaced;
}

}  // namespace pdf_a11y
