#include "test_helpers.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Discard.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace pdf_a11y_test {

static QPDFObjectHandle name(char const* n) { return QPDFObjectHandle::newName(n); }

static QPDFObjectHandle media_box() {
  return QPDFObjectHandle::newArray(QPDFObjectHandle::Rectangle(0, 0, 612, 792));
}

static QPDFObjectHandle helvetica(QPDF& pdf) {
  QPDFObjectHandle font = QPDFObjectHandle::newDictionary();
  font.replaceKey("/Type", name("/Font"));
  font.replaceKey("/Subtype", name("/Type1"));
  font.replaceKey("/BaseFont", name("/Helvetica"));
  font.replaceKey("/Encoding", name("/WinAnsiEncoding"));
  return pdf.makeIndirectObject(font);
}

static QPDFObjectHandle new_page(QPDF& pdf, QPDFObjectHandle resources, std::string const& content) {
  QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
  page.replaceKey("/Type", name("/Page"));
  page.replaceKey("/MediaBox", media_box());
  page.replaceKey("/Resources", resources);
  page.replaceKey("/Contents", pdf.newStream(content));
  return pdf.makeIndirectObject(page);
}

std::string heading_page_content(std::string const& heading, std::string const& body) {
  std::ostringstream oss;
  oss << "BT\n/F1 24 Tf\n72 720 Td\n(" << heading << ") Tj\nET\n"
      << "BT\n/F1 12 Tf\n72 680 Td\n(" << body << ") Tj\nET\n";
  return oss.str();
}

std::string write_pdf(QPDF& pdf) {
  QPDFWriter w(pdf);
  w.setOutputMemory();
  w.setStaticID(true);
  w.write();
  std::unique_ptr<Buffer> b(w.getBuffer());
  return std::string(reinterpret_cast<char const*>(b->getBuffer()), b->getSize());
}

std::string make_text_pdf(std::vector<std::string> const& contents) {
  QPDF pdf;
  pdf.emptyPDF();
  QPDFObjectHandle font = helvetica(pdf);
  QPDFPageDocumentHelper pages(pdf);

  for (auto const& content : contents) {
    QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey("/F1", font);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);
    pages.addPage(new_page(pdf, resources, content), false);
  }
  return write_pdf(pdf);
}

std::string make_image_pdf(ImagePdfOptions const& options) {
  QPDF pdf;
  pdf.emptyPDF();

  // 2x2 pixels: red, green, blue, black
  std::string pixels("\xff\x00\x00\x00\xff\x00\x00\x00\xff\x00\x00\x00", 12);
  QPDFObjectHandle image = pdf.newStream(pixels);
  QPDFObjectHandle dict = image.getDict();
  dict.replaceKey("/Type", name("/XObject"));
  dict.replaceKey("/Subtype", name("/Image"));
  dict.replaceKey("/Width", QPDFObjectHandle::newInteger(2));
  dict.replaceKey("/Height", QPDFObjectHandle::newInteger(2));
  dict.replaceKey("/ColorSpace", name("/DeviceRGB"));
  dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));

  QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
  xobjects.replaceKey("/Im0", image);
  QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
  resources.replaceKey("/XObject", xobjects);

  std::string paint = "q 100 0 0 100 72 600 cm /Im0 Do Q";
  std::string content = options.wrap_in_mcid ? "/Figure <</MCID 0>> BDC\n" + paint + "\nEMC\n" : paint + "\n";

  QPDFObjectHandle page = new_page(pdf, resources, content);
  QPDFPageDocumentHelper(pdf).addPage(page, false);

  if (options.tagged) {
    QPDFObjectHandle root = pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
    root.replaceKey("/Type", name("/StructTreeRoot"));

    QPDFObjectHandle figure = QPDFObjectHandle::newDictionary();
    figure.replaceKey("/Type", name("/StructElem"));
    figure.replaceKey("/S", name("/Figure"));
    figure.replaceKey("/P", root);
    if (options.figure_has_page) figure.replaceKey("/Pg", page);
    if (!options.figure_alt.empty()) figure.replaceKey("/Alt", QPDFObjectHandle::newString(options.figure_alt));
    figure.replaceKey("/K", QPDFObjectHandle::newInteger(0));
    figure = pdf.makeIndirectObject(figure);

    // a single bare reference, not an array
    root.replaceKey("/K", figure);

    QPDFObjectHandle mark_info = QPDFObjectHandle::newDictionary();
    mark_info.replaceKey("/Marked", QPDFObjectHandle::newBool(true));
    pdf.getRoot().replaceKey("/StructTreeRoot", root);
    pdf.getRoot().replaceKey("/MarkInfo", mark_info);
  }
  return write_pdf(pdf);
}

pdf_a11y::EngineOptions quiet_options() {
  pdf_a11y::EngineOptions options;
  options.verify_visually = false;

  auto discard = std::make_shared<Pl_Discard>();
  options.logger = QPDFLogger::create();
  options.logger->setInfo(discard);
  options.logger->setWarn(discard);
  options.logger->setError(discard);
  return options;
}

std::string temp_path(std::string const& name) {
  auto const* info = ::testing::UnitTest::GetInstance()->current_test_info();
  std::string prefix = info ? std::string(info->test_suite_name()) + "_" + info->name() + "_" : "";
  return ::testing::TempDir() + prefix + name;
}

std::string write_temp_file(std::string const& name, std::string const& bytes) {
  std::string path = temp_path(name);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << bytes;
  out.close();
  if (!out) throw std::runtime_error("cannot write " + path);
  return path;
}

std::string read_file(std::string const& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

int first_image_object_id(QPDF& pdf) {
  QPDFObjectHandle page = pdf.getAllPages().at(0);
  return page.getKey("/Resources").getKey("/XObject").getKey("/Im0").getObjectID();
}

}  // namespace pdf_a11y_test
