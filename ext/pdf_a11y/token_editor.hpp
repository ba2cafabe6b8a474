#pragma once

#include "content_tokenizer.hpp"

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pdf_a11y {

/** [x0, y0, x1, y1] */
using BBox = std::array<double, 4>;

/** Inclusive token index range: string/array operand through its show operator. */
using TextSpan = std::pair<size_t, size_t>;

struct RGB {
  double r;
  double g;
  double b;
};

/**
 * Finds the Tj/'/" and TJ operations whose decoded operand contains target
 * (ASCII case-insensitive). Spans are returned in stream order.
 */
std::vector<TextSpan> find_text_spans(TokenList const& tokens, std::string const& target);

/**
 * Finds the first run of consecutive BT...ET blocks whose text position lies
 * within pdf_bbox (PDF user space, origin bottom-left) give or take tolerance.
 * The position comes from Tm when the block has one, otherwise from the sum
 * of its Td/TD offsets.
 */
std::optional<TextSpan> find_text_block_in_bbox(TokenList const& tokens, BBox const& pdf_bbox, double tolerance);

/** Converts a top-left-origin box (as the parser reports it) to PDF user space. */
BBox flip_bbox(BBox const& top_left_bbox, double page_height);

/** One greater than the largest inline /MCID in the stream, 0 when there is none. */
int next_mcid(TokenList const& tokens);

/** Wraps span in "/<tag> <</MCID n>> BDC" ... "EMC". */
TokenList inject_marked_content(TokenList const& tokens, TextSpan span, int mcid, std::string const& tag);

/** "#RRGGBB" to channel values in 0..1, nullopt for anything else. */
std::optional<RGB> hex_to_rgb(std::string const& hex);

/**
 * Rewrites the operands of every rg/RG/scn/SCN whose three numeric operands
 * match original within tolerance. Returns the number of operators rewritten;
 * tokens are untouched when it returns 0.
 */
size_t replace_color(TokenList& tokens, RGB const& original, RGB const& fixed, double tolerance = 0.02);

/**
 * Collects the numeric operands directly preceding tokens[op_index], nearest
 * last, stopping at the first non-number. At most max_count are collected.
 */
std::vector<size_t> preceding_numbers(TokenList const& tokens, size_t op_index, size_t max_count);

}  // namespace pdf_a11y
