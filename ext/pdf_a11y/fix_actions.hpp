#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace pdf_a11y {

/** [x0, y0, x1, y1] as the document parser reports it, origin top-left. */
using ParserBBox = std::array<double, 4>;

struct Metadata {
  std::string title;
  std::string language;
};

struct HeadingAction {
  std::string element_id;
  int level = 1;
  std::string text;
  int page = 0;
  std::optional<ParserBBox> bbox;
};

struct AltTextAction {
  std::string image_id;
  std::string alt_text;
  std::optional<int> xref;  // image object id
  std::optional<int> page;
  std::optional<ParserBBox> bbox;
};

struct DecorativeAction {
  std::string image_id;
  std::optional<int> xref;
  std::optional<int> page;
};

struct ColorFix {
  std::string original_hex;  // "#RRGGBB"
  std::string fixed_hex;
};

struct TableCell {
  std::string text;
  int grid_span = 1;
};

struct TableAction {
  std::string table_id;
  int header_rows = 1;
  std::vector<std::vector<TableCell>> rows;
  int page = 0;
  std::optional<ParserBBox> bbox;
};

struct LinkAction {
  std::string link_id;
  std::string link_text;
  std::string link_url;
  int page = 0;
  std::optional<ParserBBox> bbox;
};

/** Everything one write session applies. */
struct FixRequest {
  Metadata metadata;
  std::vector<AltTextAction> alt_texts;
  std::vector<DecorativeAction> decorative;
  std::vector<HeadingAction> headings;
  std::vector<ColorFix> contrast;
  std::vector<TableAction> tables;
  std::vector<LinkAction> links;
};

struct PdfWriteResult {
  bool success = false;
  std::string output_path;
  std::vector<std::string> changes;
  std::vector<std::string> warnings;
  std::vector<std::string> errors;
  int heading_tags_applied = 0;
  int contrast_fixes_applied = 0;
  int tags_applied = 0;  // every structure element created or updated
};

}  // namespace pdf_a11y
