#include "document_handle.hpp"
#include "fixers.hpp"
#include "struct_node.hpp"
#include "struct_tree.hpp"
#include "struct_walker.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace pdf_a11y;
using namespace pdf_a11y_test;

TEST(StructWalker, UntaggedDocumentHasNoStructure) {
  auto doc = DocumentHandle::open_memory("walker", make_text_pdf({"q Q"}));
  EXPECT_THROW(dump_structure(doc->qpdf()), std::runtime_error);
}

TEST(StructWalker, PrintsFigureWithMarkedContent) {
  ImagePdfOptions opts;
  opts.tagged = true;
  opts.figure_alt = "Map <north>";
  auto doc = DocumentHandle::open_memory("walker", make_image_pdf(opts));

  std::string dump = dump_structure(doc->qpdf());
  EXPECT_NE(dump.find("<Figure obj=\""), std::string::npos) << dump;
  EXPECT_NE(dump.find("Alt=\"Map &lt;north&gt;\""), std::string::npos) << dump;
  EXPECT_NE(dump.find("Page=\"1\""), std::string::npos) << dump;
  EXPECT_NE(dump.find("  [MCID: 0]"), std::string::npos) << dump;
  EXPECT_NE(dump.find("</Figure>"), std::string::npos) << dump;
}

TEST(StructWalker, PrintsElementsCreatedByFixers) {
  auto doc = DocumentHandle::open_memory("walker", make_text_pdf({heading_page_content("Title", "Body")}));
  QPDFObjectHandle root = ensure_struct_tree(*doc);
  add_heading(*doc, root, "H1", doc->page(0), 0);

  FigureSpec spec;
  spec.alt = "Logo";
  spec.page = doc->page(0);
  spec.xref = 42;
  spec.bbox = std::array<double, 4>{10, 20, 30, 40};
  add_figure(*doc, root, spec);

  std::string dump = dump_structure(doc->qpdf());
  EXPECT_NE(dump.find("<H1 obj="), std::string::npos) << dump;
  EXPECT_NE(dump.find("[MCR: MCID=0 Page=1]"), std::string::npos) << dump;
  EXPECT_NE(dump.find("BBox=\"[10, 20, 30, 40]\" Image=\"42\" Page=\"1\">"), std::string::npos) << dump;
}

TEST(StructWalker, CyclicReferencesPrintOnce) {
  auto doc = DocumentHandle::open_memory("walker", make_text_pdf({"q Q"}));
  QPDFObjectHandle root = ensure_struct_tree(*doc);
  QPDFObjectHandle sect = new_struct_elem(*doc, root, "/Sect");
  QPDFObjectHandle p = new_struct_elem(*doc, sect, "/P");
  append_kid(*doc, p, sect);

  std::string dump = dump_structure(doc->qpdf());
  EXPECT_NE(dump.find("cycle to obj " + std::to_string(sect.getObjectID())), std::string::npos) << dump;
  EXPECT_EQ(dump.find("<Sect"), dump.rfind("<Sect")) << dump;
}

TEST(StructWalker, PageNumbersAreOneBased) {
  auto doc = DocumentHandle::open_memory("walker", make_text_pdf({"q Q", "q Q"}));
  StructWalker walker(doc->qpdf());
  EXPECT_EQ(walker.page_number_of(doc->page(1)), 2);
  EXPECT_EQ(walker.page_number_of(QPDFObjectHandle::newDictionary()), -1);
}

TEST(StructNodeText, EscapesMarkup) {
  EXPECT_EQ(xml_escape("a & \"b\" <c>"), "a &amp; &quot;b&quot; &lt;c&gt;");
  EXPECT_EQ(strip_slash("/Figure"), "Figure");
}
