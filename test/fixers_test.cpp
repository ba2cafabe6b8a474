#include "fixers.hpp"
#include "page_contents.hpp"
#include "pdf_text.hpp"
#include "struct_tree.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace pdf_a11y;
using namespace pdf_a11y_test;

namespace {

class FixersTest : public ::testing::Test {
 protected:
  void open(std::string bytes) { doc = DocumentHandle::open_memory("fixers test", std::move(bytes)); }

  FixContext context() { return FixContext(*doc, options, result); }

  bool has_change(std::string const& msg) const {
    return std::find(result.changes.begin(), result.changes.end(), msg) != result.changes.end();
  }
  bool has_warning(std::string const& msg) const {
    return std::find(result.warnings.begin(), result.warnings.end(), msg) != result.warnings.end();
  }
  bool has_warning_starting(std::string const& prefix) const {
    return std::any_of(result.warnings.begin(), result.warnings.end(),
                       [&](std::string const& w) { return w.compare(0, prefix.size(), prefix) == 0; });
  }

  std::string page_content(int index) { return PageContents(*doc, doc->page(index)).read(); }

  EngineOptions options = quiet_options();
  PdfWriteResult result;
  std::unique_ptr<DocumentHandle> doc;
};

AltTextAction alt(std::string id, std::string text, std::optional<int> xref, std::optional<int> page = std::nullopt) {
  AltTextAction a;
  a.image_id = std::move(id);
  a.alt_text = std::move(text);
  a.xref = xref;
  a.page = page;
  return a;
}

HeadingAction heading(std::string id, std::string text, int page, int level = 2) {
  HeadingAction h;
  h.element_id = std::move(id);
  h.text = std::move(text);
  h.page = page;
  h.level = level;
  return h;
}

}  // namespace

TEST_F(FixersTest, PageGeometry) {
  open(make_text_pdf({"q Q"}));
  EXPECT_DOUBLE_EQ(page_top(doc->page(0)), 792);
  EXPECT_TRUE(valid_page(*doc, 0));
  EXPECT_FALSE(valid_page(*doc, 1));
  EXPECT_FALSE(valid_page(*doc, -1));

  BBox box = to_user_space(*doc, 0, ParserBBox{72, 52, 300, 80});
  EXPECT_DOUBLE_EQ(box[1], 712);
  EXPECT_DOUBLE_EQ(box[3], 740);
}

TEST_F(FixersTest, SetsTitleLanguageAndDisplayDocTitle) {
  open(make_text_pdf({"q Q"}));
  FixContext ctx = context();
  apply_metadata(ctx, Metadata{"Syllabus", "en"});

  EXPECT_TRUE(has_change("Set PDF title: Syllabus"));
  EXPECT_TRUE(has_change("Set DisplayDocTitle"));
  EXPECT_TRUE(has_change("Set PDF language: en"));

  QPDF& pdf = doc->qpdf();
  EXPECT_EQ(text_string_value(pdf.getTrailer().getKey("/Info").getKey("/Title")), "Syllabus");
  EXPECT_EQ(text_string_value(pdf.getRoot().getKey("/Lang")), "en");
  EXPECT_TRUE(pdf.getRoot().getKey("/ViewerPreferences").getKey("/DisplayDocTitle").getBoolValue());
  EXPECT_TRUE(doc->has_changes());
}

TEST_F(FixersTest, MetadataIsIdempotent) {
  open(make_text_pdf({"q Q"}));
  FixContext ctx = context();
  apply_metadata(ctx, Metadata{"Syllabus", "en"});
  result.changes.clear();

  apply_metadata(ctx, Metadata{"Syllabus", "en"});
  ASSERT_EQ(result.changes.size(), 2u);
  EXPECT_EQ(result.changes[0], "Title unchanged: Syllabus");
  EXPECT_EQ(result.changes[1], "Language unchanged: en");
}

TEST_F(FixersTest, MetadataWithNoBreakSpaceIsIdempotent) {
  std::string const title = "Week\xc2\xa0" "1 Syllabus";
  open(make_text_pdf({"q Q"}));
  FixContext ctx = context();
  apply_metadata(ctx, Metadata{title, ""});
  EXPECT_TRUE(has_change("Set PDF title: " + title));
  result.changes.clear();

  apply_metadata(ctx, Metadata{title, ""});
  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes[0], "Title unchanged: " + title);
}

TEST_F(FixersTest, EmptyMetadataChangesNothing) {
  open(make_text_pdf({"q Q"}));
  FixContext ctx = context();
  apply_metadata(ctx, Metadata());
  EXPECT_TRUE(result.changes.empty());
  EXPECT_FALSE(doc->has_changes());
}

TEST_F(FixersTest, CreatesFigureOnUntaggedDocument) {
  open(make_image_pdf());
  int image_id = first_image_object_id(doc->qpdf());

  FixContext ctx = context();
  apply_alt_texts(ctx, {alt("img1", "Enrollment chart", image_id)}, {});

  EXPECT_TRUE(has_change("Created /Figure for img1 with alt: Enrollment chart"));
  EXPECT_EQ(result.tags_applied, 1);
  ASSERT_TRUE(is_tagged(doc->qpdf()));

  auto figures = find_elements_by_type(ensure_struct_tree(*doc), "/Figure");
  ASSERT_EQ(figures.size(), 1u);
  QPDFObjectHandle fig = figures[0].elem;
  EXPECT_EQ(text_string_value(fig.getKey("/Alt")), "Enrollment chart");
  EXPECT_EQ(fig.getKey("/A11yXref").getIntValueAsInt(), image_id);
  EXPECT_EQ(fig.getKey("/Pg").getObjGen(), doc->page(0).getObjGen());
  EXPECT_NEAR(fig.getKey("/A").getKey("/BBox").getArrayItem(0).getNumericValue(), 72, 0.01);
}

TEST_F(FixersTest, UpdatesExistingFigureByImage) {
  ImagePdfOptions opts;
  opts.tagged = true;
  open(make_image_pdf(opts));
  int image_id = first_image_object_id(doc->qpdf());

  FixContext ctx = context();
  apply_alt_texts(ctx, {alt("img1", "Campus map", image_id)}, {});

  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes[0].rfind("Set alt text on img1 (obj ", 0), 0u);
  EXPECT_TRUE(result.warnings.empty());

  auto figures = find_elements_by_type(ensure_struct_tree(*doc), "/Figure");
  ASSERT_EQ(figures.size(), 1u);
  EXPECT_EQ(text_string_value(figures[0].elem.getKey("/Alt")), "Campus map");
  EXPECT_TRUE(doc->dirty().count(figures[0].owner.getObjGen()));
}

TEST_F(FixersTest, DecorativeWinsOverAltText) {
  ImagePdfOptions opts;
  opts.tagged = true;
  open(make_image_pdf(opts));
  int image_id = first_image_object_id(doc->qpdf());

  DecorativeAction d;
  d.image_id = "img1";
  d.xref = image_id;

  FixContext ctx = context();
  apply_alt_texts(ctx, {alt("img1", "Divider", image_id)}, {d});

  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes[0].rfind("Marked img1 as decorative", 0), 0u);
  auto figures = find_elements_by_type(ensure_struct_tree(*doc), "/Figure");
  ASSERT_EQ(figures.size(), 1u);
  EXPECT_EQ(text_string_value(figures[0].elem.getKey("/Alt")), "");
}

TEST_F(FixersTest, UnmatchedImagesGetNewFigures) {
  ImagePdfOptions opts;
  opts.tagged = true;
  open(make_image_pdf(opts));

  FixContext ctx = context();
  apply_alt_texts(ctx, {alt("ghost", "Not on the page", 9999)}, {});

  EXPECT_TRUE(has_warning("Could not find struct elements for images: ghost"));
  EXPECT_TRUE(has_change("Created /Figure for ghost with alt: Not on the page"));
  EXPECT_EQ(find_elements_by_type(ensure_struct_tree(*doc), "/Figure").size(), 2u);
}

TEST_F(FixersTest, RewritesFilenameAltOnExistingFigures) {
  ImagePdfOptions opts;
  opts.tagged = true;
  opts.figure_alt = "image1.png";
  open(make_image_pdf(opts));

  FixContext ctx = context();
  update_figure_alt_texts(ctx, {alt("img1", "Bar chart of enrollment", std::nullopt, 0)});

  EXPECT_TRUE(has_change("Updated alt on img1 (page 0): Bar chart of enrollment"));
  auto figures = find_elements_by_type(ensure_struct_tree(*doc), "/Figure");
  EXPECT_EQ(text_string_value(figures[0].elem.getKey("/Alt")), "Bar chart of enrollment");
}

TEST_F(FixersTest, KeepsDescriptiveAltOnExistingFigures) {
  ImagePdfOptions opts;
  opts.tagged = true;
  opts.figure_alt = "Photograph of the main lecture hall";
  open(make_image_pdf(opts));

  FixContext ctx = context();
  update_figure_alt_texts(ctx, {alt("img1", "Something else", std::nullopt, 0)});

  EXPECT_TRUE(result.changes.empty());
  auto figures = find_elements_by_type(ensure_struct_tree(*doc), "/Figure");
  EXPECT_EQ(text_string_value(figures[0].elem.getKey("/Alt")), "Photograph of the main lecture hall");
}

TEST_F(FixersTest, TagsTables) {
  open(make_text_pdf({"q Q"}));

  TableAction t;
  t.table_id = "t1";
  t.header_rows = 1;
  t.rows = {{{"Week", 1}, {"Topic", 1}}, {{"Orientation", 2}}, {}};
  t.bbox = ParserBBox{72, 100, 540, 300};

  FixContext ctx = context();
  apply_tables(ctx, {t});

  EXPECT_TRUE(has_change("Tagged table t1 on page 0 with 1 header row(s) (2 rows, 3 cells)"));
  EXPECT_EQ(result.tags_applied, 1);

  QPDFObjectHandle root = ensure_struct_tree(*doc);
  auto headers = find_elements_by_type(root, "/TH");
  auto cells = find_elements_by_type(root, "/TD");
  ASSERT_EQ(headers.size(), 2u);
  ASSERT_EQ(cells.size(), 1u);
  EXPECT_TRUE(headers[0].elem.getKey("/Scope").isNameAndEquals("/Column"));
  EXPECT_EQ(text_string_value(headers[1].elem.getKey("/ActualText")), "Topic");
  EXPECT_EQ(cells[0].elem.getKey("/ColSpan").getIntValueAsInt(), 2);
  EXPECT_FALSE(headers[0].elem.hasKey("/ColSpan"));

  auto tables = find_elements_by_type(root, "/Table");
  ASSERT_EQ(tables.size(), 1u);
  EXPECT_DOUBLE_EQ(tables[0].elem.getKey("/A").getKey("/BBox").getArrayItem(1).getNumericValue(), 492);
}

TEST_F(FixersTest, TagsLinksAndReferencesAnnotation) {
  open(make_text_pdf({"q Q"}));

  QPDFObjectHandle action = QPDFObjectHandle::newDictionary();
  action.replaceKey("/S", QPDFObjectHandle::newName("/URI"));
  action.replaceKey("/URI", QPDFObjectHandle::newString("https://example.edu/course"));
  QPDFObjectHandle annot = QPDFObjectHandle::newDictionary();
  annot.replaceKey("/Type", QPDFObjectHandle::newName("/Annot"));
  annot.replaceKey("/Subtype", QPDFObjectHandle::newName("/Link"));
  annot.replaceKey("/Rect", QPDFObjectHandle::newArray(QPDFObjectHandle::Rectangle(72, 700, 200, 712)));
  annot.replaceKey("/A", action);
  annot = doc->make_indirect(annot);
  doc->page(0).replaceKey("/Annots", QPDFObjectHandle::newArray(std::vector<QPDFObjectHandle>{annot}));

  LinkAction l;
  l.link_id = "l1";
  l.link_text = "Course site";
  l.link_url = "https://example.edu/course";

  FixContext ctx = context();
  apply_links(ctx, {l});

  EXPECT_TRUE(has_change("Set link text on l1 page 0: Course site"));
  auto links = find_elements_by_type(ensure_struct_tree(*doc), "/Link");
  ASSERT_EQ(links.size(), 1u);
  QPDFObjectHandle link = links[0].elem;
  EXPECT_EQ(text_string_value(link.getKey("/Alt")), "Course site");
  EXPECT_EQ(text_string_value(link.getKey("/ActualText")), "Course site");
  EXPECT_TRUE(link.getKey("/K").getKey("/Type").isNameAndEquals("/OBJR"));
  EXPECT_EQ(link.getKey("/K").getKey("/Obj").getObjGen(), annot.getObjGen());
}

TEST_F(FixersTest, TagsHeadingByText) {
  open(make_text_pdf({heading_page_content("Course Description", "Students will learn."), "q Q"}));

  FixContext ctx = context();
  apply_headings(ctx, {heading("h1", "Course Description", 0)});

  EXPECT_TRUE(has_change("Tagged heading h1 \"Course Description\" as H2 on page 0 (MCID 0)"));
  EXPECT_EQ(result.heading_tags_applied, 1);
  EXPECT_EQ(result.tags_applied, 1);
  EXPECT_NE(page_content(0).find("/H2 <</MCID 0>> BDC\n(Course Description) Tj\nEMC"), std::string::npos);

  auto headings = find_elements_by_type(ensure_struct_tree(*doc), "/H2");
  ASSERT_EQ(headings.size(), 1u);
  EXPECT_EQ(headings[0].elem.getKey("/K").getKey("/MCID").getIntValueAsInt(), 0);
}

TEST_F(FixersTest, HeadingUsesNextFreeMcid) {
  std::string content = "/P <</MCID 3>> BDC\n" + heading_page_content("Intro", "Body") + "EMC\n" +
                        heading_page_content("Schedule", "Weekly");
  open(make_text_pdf({content}));

  FixContext ctx = context();
  apply_headings(ctx, {heading("h1", "schedule", 0, 1)});

  EXPECT_TRUE(has_change("Tagged heading h1 \"schedule\" as H1 on page 0 (MCID 4)"));
}

TEST_F(FixersTest, HeadingFallsBackToBoundingBox) {
  open(make_text_pdf({heading_page_content("Course Description", "Body")}));

  HeadingAction h = heading("h1", "Text drawn with a CID font", 0);
  h.bbox = ParserBBox{60, 50, 400, 90};

  FixContext ctx = context();
  apply_headings(ctx, {h});

  EXPECT_EQ(result.heading_tags_applied, 1);
  EXPECT_NE(page_content(0).find("/H2 <</MCID 0>> BDC\nBT"), std::string::npos);
}

TEST_F(FixersTest, SkipsHeadingsThatCannotBePlaced) {
  open(make_text_pdf({heading_page_content("Title", "Body")}));
  std::string before = page_content(0);

  FixContext ctx = context();
  apply_headings(ctx, {heading("h1", "Missing", 0), heading("h2", "Title", 5)});

  EXPECT_TRUE(has_warning("Skipped heading h1 \"Missing\": text not found on page 0"));
  EXPECT_TRUE(has_warning("Skipped heading h2 \"Title\": page 5 does not exist"));
  EXPECT_EQ(result.heading_tags_applied, 0);
  EXPECT_EQ(page_content(0), before);
  EXPECT_FALSE(doc->has_changes());
}

TEST_F(FixersTest, GivesUpHeadingWhenEveryAttemptIsRejected) {
  open(make_text_pdf({heading_page_content("Course Description", "Students will learn.")}));
  std::string before = page_content(0);

  options.heading_tolerance_percent = -1;
  FixContext ctx = context();
  apply_headings(ctx, {heading("h1", "Course Description", 0)});

  EXPECT_TRUE(has_warning(
      "Gave up heading h1 \"Course Description\" after 5 attempts: tagging changed the page's appearance"));
  EXPECT_EQ(result.heading_tags_applied, 0);
  EXPECT_EQ(result.tags_applied, 0);
  EXPECT_TRUE(result.changes.empty());
  EXPECT_EQ(page_content(0), before);
  EXPECT_TRUE(doc->qpdf().getRoot().getKey("/StructTreeRoot").isNull());
  EXPECT_FALSE(doc->has_changes());
}

TEST_F(FixersTest, HonorsMaxHeadingAttempts) {
  open(make_text_pdf({heading_page_content("Intro", "Body")}));

  options.heading_tolerance_percent = -1;
  options.max_heading_attempts = 2;
  FixContext ctx = context();
  apply_headings(ctx, {heading("h1", "Intro", 0)});

  EXPECT_TRUE(has_warning("Gave up heading h1 \"Intro\" after 2 attempts: tagging changed the page's appearance"));
  EXPECT_FALSE(doc->has_changes());
}

TEST_F(FixersTest, ReplacesContrastColors) {
  open(make_text_pdf({"0.5 0.5 0.5 rg\n" + heading_page_content("Title", "Body"), "0 0 0 rg"}));

  FixContext ctx = context();
  apply_contrast(ctx, {ColorFix{"#808080", "#333333"}});

  EXPECT_TRUE(has_change("Changed color #808080 -> #333333 on page 0 (1 operators)"));
  EXPECT_EQ(result.contrast_fixes_applied, 1);
  EXPECT_EQ(page_content(0).rfind("0.2000 0.2000 0.2000 rg", 0), 0u);
  EXPECT_EQ(page_content(1), "0 0 0 rg");
}

TEST_F(FixersTest, IgnoresInvalidColorFixes) {
  open(make_text_pdf({"0.5 0.5 0.5 rg"}));

  FixContext ctx = context();
  apply_contrast(ctx, {ColorFix{"808080", "#333333"}, ColorFix{"#808080", "#808080"}});

  EXPECT_TRUE(has_warning("Ignored color fix 808080 -> #333333: colors must be #RRGGBB"));
  EXPECT_TRUE(has_warning("Ignored color fix #808080 -> #808080: original equals fix"));
  EXPECT_EQ(result.contrast_fixes_applied, 0);
  EXPECT_FALSE(doc->has_changes());
}

TEST_F(FixersTest, RevertsContrastFixesThatChangeThePage) {
  std::string const content = "0.5 0.5 0.5 rg\n72 400 300 200 re f\n";
  open(make_text_pdf({content}));

  options.verify_visually = true;
  options.contrast_tolerance_percent = 0;
  FixContext ctx = context();
  apply_contrast(ctx, {ColorFix{"#808080", "#000000"}});

  EXPECT_TRUE(has_warning_starting("Reverted contrast fixes on page 0: "));
  EXPECT_TRUE(result.changes.empty());
  EXPECT_EQ(result.contrast_fixes_applied, 0);
  EXPECT_EQ(page_content(0), content);
  EXPECT_FALSE(doc->has_changes());
}

TEST_F(FixersTest, KeepsVerifiedContrastFixesWithinTolerance) {
  open(make_text_pdf({"0.5 0.5 0.5 rg\n72 400 300 200 re f\n"}));

  options.verify_visually = true;
  options.contrast_tolerance_percent = 50;
  FixContext ctx = context();
  apply_contrast(ctx, {ColorFix{"#808080", "#000000"}});

  EXPECT_TRUE(result.warnings.empty());
  EXPECT_TRUE(has_change("Changed color #808080 -> #000000 on page 0 (1 operators)"));
  EXPECT_EQ(page_content(0).rfind("0.0000 0.0000 0.0000 rg", 0), 0u);
}
