#pragma once

#define POINTERHOLDER_TRANSITION 1

#include "document_handle.hpp"

#include <qpdf/QPDFObjectHandle.hh>

#include <string>

namespace pdf_a11y {

/**
 * Reads and replaces the content of one page.
 *
 * A page with a single content stream is edited in place. A page whose
 * /Contents is an array gets one merged stream on the first write; later
 * writes edit that stream.
 */
class PageContents {
 public:
  struct Snapshot {
    QPDFObjectHandle contents;  // the page's /Contents value
    QPDFObjectHandle stream;    // the single stream, null when /Contents was an array
    std::string raw_data;
    QPDFObjectHandle filter;
    QPDFObjectHandle decode_parms;
    DocumentHandle::DirtySet dirty;
  };

  PageContents(DocumentHandle& doc, QPDFObjectHandle page);

  /** Decoded content, multiple streams joined with a newline. */
  std::string read() const;

  /** Replaces the page's content with data, stored unfiltered. */
  void write(std::string const& data);

  Snapshot snapshot() const;
  void restore(Snapshot const& snap);

  QPDFObjectHandle page() const { return m_page; }

 private:
  DocumentHandle& m_doc;
  QPDFObjectHandle m_page;
};

}  // namespace pdf_a11y
