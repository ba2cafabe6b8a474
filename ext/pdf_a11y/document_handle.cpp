#define POINTERHOLDER_TRANSITION 1

#include "document_handle.hpp"
#include "incremental_writer.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QUtil.hh>
#include <stdexcept>
#include <cerrno>

namespace pdf_a11y {

std::unique_ptr<DocumentHandle> DocumentHandle::open(std::string const& filename,
                                                     std::shared_ptr<QPDFLogger> logger) {
  auto qpdf = std::make_shared<QPDF>();
  if (logger) qpdf->setLogger(logger);
  try {
    qpdf->processFile(filename.c_str());
  } catch (QPDFExc const& qex) {
    throw std::runtime_error(std::string("pdf_a11y: failed to open \"") + filename + "\": " + qex.what() +
                             " (code: " + std::to_string(qex.getErrorCode()) + ")");
  } catch (std::exception const& ex) {
    throw std::runtime_error(std::string("pdf_a11y: failed to open \"") + filename + "\": " + ex.what());
  }

  std::unique_ptr<DocumentHandle> h(new DocumentHandle(qpdf, filename));
  h->m_encrypted = qpdf->isEncrypted();
  // warnings while parsing mean qpdf reconstructed the xref table
  h->m_repaired = qpdf->anyWarnings();
  return h;
}

std::unique_ptr<DocumentHandle> DocumentHandle::open_memory(std::string const& desc, std::string data,
                                                            std::shared_ptr<QPDFLogger> logger) {
  auto qpdf = std::make_shared<QPDF>();
  if (logger) qpdf->setLogger(logger);

  std::unique_ptr<DocumentHandle> h(new DocumentHandle(qpdf, ""));
  h->m_owned_buf = std::move(data);  // keep bytes alive
  try {
    qpdf->processMemoryFile(desc.c_str(), h->m_owned_buf.data(), h->m_owned_buf.size());
  } catch (std::exception const& ex) {
    throw std::runtime_error("pdf_a11y: open_memory failed: " + std::string(ex.what()));
  }
  h->m_encrypted = qpdf->isEncrypted();
  h->m_repaired = qpdf->anyWarnings();
  return h;
}

DocumentHandle::DocumentHandle(std::shared_ptr<QPDF> qpdf, std::string filename)
    : m_qpdf(std::move(qpdf)), m_filename(std::move(filename)) {}

DocumentHandle::~DocumentHandle() { close(); }

QPDF& DocumentHandle::qpdf() {
  if (!m_qpdf) throw std::runtime_error("pdf_a11y: document is closed");
  return *m_qpdf;
}

QPDF const& DocumentHandle::qpdf() const {
  if (!m_qpdf) throw std::runtime_error("pdf_a11y: document is closed");
  return *m_qpdf;
}

std::vector<QPDFObjectHandle> const& DocumentHandle::pages() { return qpdf().getAllPages(); }

QPDFObjectHandle DocumentHandle::page(int index) {
  auto const& all = pages();
  if (index < 0 || static_cast<size_t>(index) >= all.size()) {
    throw std::runtime_error("pdf_a11y: page " + std::to_string(index) + " out of range (document has " +
                             std::to_string(all.size()) + " pages)");
  }
  return all.at(static_cast<size_t>(index));
}

void DocumentHandle::mark_dirty(QPDFObjectHandle oh) {
  if (!oh.isIndirect()) throw std::logic_error("pdf_a11y: only indirect objects can be tracked");
  m_dirty[oh.getObjGen()] = oh;
}

QPDFObjectHandle DocumentHandle::make_indirect(QPDFObjectHandle direct) {
  auto oh = qpdf().makeIndirectObject(direct);
  mark_dirty(oh);
  return oh;
}

QPDFObjectHandle DocumentHandle::new_stream(std::string const& data) {
  auto oh = qpdf().newStream(data);
  mark_dirty(oh);
  return oh;
}

std::string DocumentHandle::incremental_blocker() const {
  if (m_filename.empty()) return "document was opened from memory";
  if (m_encrypted) return "document is encrypted";
  if (m_repaired) return "document was repaired while opening";
  return "";
}

SaveMode DocumentHandle::save(bool incremental) {
  if (!has_changes()) return SaveMode::Unchanged;
  if (m_filename.empty()) throw std::runtime_error("pdf_a11y: document opened from memory has no file to save to");

  if (incremental && incremental_blocker().empty()) {
    IncrementalWriter writer(m_filename);
    writer.append(qpdf(), m_dirty);
    m_dirty.clear();
    m_trailer_changed = false;
    return SaveMode::Incremental;
  }

  rewrite_in_place();
  m_dirty.clear();
  m_trailer_changed = false;
  return SaveMode::FullRewrite;
}

// qpdf reads the input lazily, so the new file is written beside it and
// moved over it once complete.
void DocumentHandle::rewrite_in_place() {
  std::string tmp = m_filename + ".tmp";
  try {
    QPDFWriter w(qpdf(), tmp.c_str());
    w.write();
  } catch (std::exception const& ex) {
    if (QUtil::file_can_be_opened(tmp.c_str())) QUtil::remove_file(tmp.c_str());
    throw std::runtime_error(std::string("pdf_a11y: failed to write \"") + m_filename + "\": " + ex.what());
  }
  QUtil::rename_file(tmp.c_str(), m_filename.c_str());
}

void DocumentHandle::write(std::string const& out_filename) {
  try {
    QPDFWriter w(qpdf(), out_filename.c_str());
    w.write();
  } catch (std::exception const& ex) {
    throw std::runtime_error(std::string("pdf_a11y: failed to write \"") + out_filename + "\": " + ex.what());
  }
}

std::string DocumentHandle::write_to_memory() {
  try {
    QPDFWriter w(qpdf(), nullptr);
    w.setStaticID(true);
    w.setOutputMemory();
    w.write();

    // the caller owns the buffer returned by getBuffer()
    std::unique_ptr<Buffer> b(w.getBuffer());
    return std::string(reinterpret_cast<char const*>(b->getBuffer()), b->getSize());
  } catch (std::exception const& ex) {
    throw std::runtime_error("pdf_a11y: write_to_memory failed: " + std::string(ex.what()));
  }
}

void DocumentHandle::close() {
  m_dirty.clear();
  m_qpdf.reset();
}

// ------------------------- C bridge impl --------------------------------

extern "C" {
DocumentHandle* pdf_a11y_open(char const* filename) { return DocumentHandle::open(filename).release(); }

DocumentHandle* pdf_a11y_open_memory(char const* desc, unsigned char const* buf, size_t len) {
  std::string copy(reinterpret_cast<char const*>(buf), len);
  return DocumentHandle::open_memory(desc, std::move(copy)).release();
}

int pdf_a11y_write(DocumentHandle* handle, char const* out_filename) {
  if (!handle || handle->is_closed()) {
    errno = EBADF;
    return -1;
  }

  handle->write(out_filename);
  return 0;
}

void pdf_a11y_close(DocumentHandle* handle) {
  delete handle;  // ok on nullptr
}
}  // extern "C"

}  // namespace pdf_a11y
