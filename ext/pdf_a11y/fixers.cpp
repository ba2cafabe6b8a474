#include "fixers.hpp"

#include <qpdf/QPDFPageObjectHelper.hh>

#include <algorithm>

namespace pdf_a11y {

FixContext::FixContext(DocumentHandle& doc, EngineOptions const& options, PdfWriteResult& result)
    : doc(doc), options(options), result(result), log(options.logger) {}

void FixContext::change(std::string const& msg) {
  result.changes.push_back(msg);
  log.info(msg);
}

void FixContext::warning(std::string const& msg) {
  result.warnings.push_back(msg);
  log.warn(msg);
}

double page_top(QPDFObjectHandle page) {
  QPDFPageObjectHelper poh(page);
  QPDFObjectHandle mb = poh.getMediaBox();
  if (!mb.isRectangle()) return 792.0;  // US Letter

  auto r = mb.getArrayAsRectangle();
  return std::max(r.lly, r.ury);
}

BBox to_user_space(DocumentHandle& doc, int page_index, ParserBBox const& bbox) {
  return flip_bbox(bbox, page_top(doc.page(page_index)));
}

bool valid_page(DocumentHandle& doc, int page_index) {
  return page_index >= 0 && static_cast<size_t>(page_index) < doc.pages().size();
}

}  // namespace pdf_a11y
