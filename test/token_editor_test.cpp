#include "token_editor.hpp"

#include <gtest/gtest.h>

using namespace pdf_a11y;

namespace {

TokenList tokens_of(std::string const& s) { return ContentTokenizer::tokenize(s); }

}  // namespace

TEST(TokenEditor, FindsTextSpansCaseInsensitively) {
  auto tokens = tokens_of("BT (Intro) Tj ET BT [(COURSE ) -50 (Description)] TJ ET BT (course description) ' ET");
  auto spans = find_text_spans(tokens, "Course Description");
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(tokens[spans[0].first].kind, TokenKind::Array);
  EXPECT_TRUE(tokens[spans[0].second].is_operator("TJ"));
  EXPECT_TRUE(tokens[spans[1].second].is_operator("'"));

  EXPECT_TRUE(find_text_spans(tokens, "missing").empty());
  EXPECT_TRUE(find_text_spans(tokens, "").empty());
}

TEST(TokenEditor, FindsBlockByTdPosition) {
  auto tokens = tokens_of("BT 72 720 Td (A) Tj ET BT 72 400 Td (B) Tj ET");
  auto span = find_text_block_in_bbox(tokens, BBox{60, 700, 300, 740}, 2.0);
  ASSERT_TRUE(span.has_value());
  EXPECT_TRUE(tokens[span->first].is_operator("BT"));
  EXPECT_TRUE(tokens[span->second].is_operator("ET"));
  EXPECT_EQ(reassemble(TokenList(tokens.begin() + span->first, tokens.begin() + span->second + 1)),
            "BT 72 720 Td (A) Tj ET");
}

TEST(TokenEditor, TmTakesPrecedenceOverTd) {
  auto tokens = tokens_of("BT 1 0 0 1 72 100 Tm 0 620 Td (A) Tj ET");
  EXPECT_FALSE(find_text_block_in_bbox(tokens, BBox{60, 700, 300, 740}, 2.0).has_value());
  EXPECT_TRUE(find_text_block_in_bbox(tokens, BBox{60, 90, 300, 110}, 2.0).has_value());
}

TEST(TokenEditor, FlipsTopLeftBoxes) {
  BBox flipped = flip_bbox(BBox{72, 50, 300, 80}, 792);
  EXPECT_DOUBLE_EQ(flipped[0], 72);
  EXPECT_DOUBLE_EQ(flipped[1], 712);
  EXPECT_DOUBLE_EQ(flipped[2], 300);
  EXPECT_DOUBLE_EQ(flipped[3], 742);
}

TEST(TokenEditor, NextMcidFollowsLargestInlineMcid) {
  EXPECT_EQ(next_mcid(tokens_of("BT (x) Tj ET")), 0);
  EXPECT_EQ(next_mcid(tokens_of("/P <</MCID 4>> BDC EMC /Span <</Lang (en) /MCID 11>> BDC EMC")), 12);
  // only dictionaries count
  EXPECT_EQ(next_mcid(tokens_of("(/MCID 99) Tj")), 0);
}

TEST(TokenEditor, InjectsMarkedContentAroundSpan) {
  auto tokens = tokens_of("BT (Title) Tj ET");
  auto spans = find_text_spans(tokens, "title");
  ASSERT_EQ(spans.size(), 1u);

  auto edited = inject_marked_content(tokens, spans[0], 5, "H2");
  EXPECT_EQ(reassemble(edited), "BT /H2 <</MCID 5>> BDC\n(Title) Tj\nEMC\n ET");
  EXPECT_EQ(next_mcid(edited), 6);
}

TEST(TokenEditor, ParsesHexColors) {
  auto c = hex_to_rgb("#FF8000");
  ASSERT_TRUE(c.has_value());
  EXPECT_DOUBLE_EQ(c->r, 1.0);
  EXPECT_NEAR(c->g, 128 / 255.0, 1e-9);
  EXPECT_DOUBLE_EQ(c->b, 0.0);

  EXPECT_FALSE(hex_to_rgb("FF8000").has_value());
  EXPECT_FALSE(hex_to_rgb("#FF80").has_value());
  EXPECT_FALSE(hex_to_rgb("#GG8000").has_value());
}

TEST(TokenEditor, ReplacesMatchingRgbTriples) {
  auto tokens = tokens_of("0.5000 0.5000 0.5000 rg (x) Tj 0.5 0.5 0.5 RG 0 0 0 rg");
  size_t n = replace_color(tokens, RGB{0.5, 0.5, 0.5}, RGB{0.2, 0.2, 0.2});
  EXPECT_EQ(n, 2u);
  EXPECT_EQ(reassemble(tokens), "0.2000 0.2000 0.2000 rg (x) Tj 0.2000 0.2000 0.2000 RG 0 0 0 rg");
}

TEST(TokenEditor, SeesOperatorsAfterInlineImages) {
  auto tokens = tokens_of("q BI /W 1 /H 1 /BPC 8 /CS /RGB ID (\xff\x80 EI Q 0.5 0.5 0.5 rg BT (Intro) Tj ET");
  EXPECT_EQ(find_text_spans(tokens, "Intro").size(), 1u);
  EXPECT_EQ(replace_color(tokens, RGB{0.5, 0.5, 0.5}, RGB{0.2, 0.2, 0.2}), 1u);
  EXPECT_EQ(reassemble(tokens),
            "q BI /W 1 /H 1 /BPC 8 /CS /RGB ID (\xff\x80 EI Q 0.2000 0.2000 0.2000 rg BT (Intro) Tj ET");
}

TEST(TokenEditor, LeavesStreamUntouchedWithoutMatch) {
  std::string const original = "0.1 0.1 0.1 rg (x) Tj 1 0 0 1 0 0 cm";
  auto tokens = tokens_of(original);
  EXPECT_EQ(replace_color(tokens, RGB{0.5, 0.5, 0.5}, RGB{0.2, 0.2, 0.2}), 0u);
  EXPECT_EQ(reassemble(tokens), original);
}

TEST(TokenEditor, IgnoresFourComponentColors) {
  std::string const original = "0 0.5 0.5 0.5 scn 0.5 0.5 0.5 0 k";
  auto tokens = tokens_of(original);
  EXPECT_EQ(replace_color(tokens, RGB{0.5, 0.5, 0.5}, RGB{0.2, 0.2, 0.2}), 0u);
  EXPECT_EQ(reassemble(tokens), original);
}

TEST(TokenEditor, PrecedingNumbersStopAtNonNumber) {
  auto tokens = tokens_of("/Cs1 cs 0.1 0.2 0.3 scn");
  size_t op = tokens.size() - 1;
  ASSERT_TRUE(tokens[op].is_operator("scn"));
  auto nums = preceding_numbers(tokens, op, 4);
  ASSERT_EQ(nums.size(), 3u);
  EXPECT_EQ(tokens[nums[0]].value, "0.1");
  EXPECT_EQ(tokens[nums[2]].value, "0.3");
}
