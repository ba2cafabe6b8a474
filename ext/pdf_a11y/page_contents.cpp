#include "page_contents.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <stdexcept>

namespace pdf_a11y {

static std::string buffer_string(std::shared_ptr<Buffer> const& b) {
  return std::string(reinterpret_cast<char const*>(b->getBuffer()), b->getSize());
}

PageContents::PageContents(DocumentHandle& doc, QPDFObjectHandle page) : m_doc(doc), m_page(page) {}

std::string PageContents::read() const {
  QPDFPageObjectHelper poh(m_page);

  std::string data;
  bool first = true;
  for (auto& stream : poh.getPageContents()) {
    if (!first) data += "\n";
    data += buffer_string(stream.getStreamData(qpdf_dl_generalized));
    first = false;
  }
  return data;
}

void PageContents::write(std::string const& data) {
  QPDFObjectHandle contents = m_page.getKey("/Contents");

  if (contents.isStream() && contents.isIndirect()) {
    contents.replaceStreamData(data, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
    m_doc.mark_dirty(contents);
    return;
  }

  QPDFObjectHandle merged = m_doc.new_stream(data);
  m_page.replaceKey("/Contents", merged);
  m_doc.mark_dirty(m_page);
}

PageContents::Snapshot PageContents::snapshot() const {
  QPDFObjectHandle page = m_page;
  Snapshot snap;
  snap.contents = page.getKey("/Contents");
  snap.dirty = m_doc.dirty();

  if (snap.contents.isStream()) {
    QPDFObjectHandle stream = snap.contents;
    QPDFObjectHandle dict = stream.getDict();
    snap.stream = stream;
    snap.raw_data = buffer_string(stream.getRawStreamData());
    snap.filter = dict.getKey("/Filter");
    snap.decode_parms = dict.getKey("/DecodeParms");
  }
  return snap;
}

void PageContents::restore(Snapshot const& snap) {
  if (snap.stream.isInitialized() && snap.stream.isStream()) {
    QPDFObjectHandle stream = snap.stream;
    stream.replaceStreamData(snap.raw_data, snap.filter, snap.decode_parms);
  }
  m_page.replaceKey("/Contents", snap.contents);
  m_doc.restore_dirty(snap.dirty);
}

}  // namespace pdf_a11y
