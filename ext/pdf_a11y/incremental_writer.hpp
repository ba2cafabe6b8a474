#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <map>
#include <string>

namespace pdf_a11y {

/**
 * Appends changed objects to an existing PDF file as an incremental update:
 *
 *   N G obj ... endobj      (one per changed object)
 *   xref                    (classic table, one subsection per id run)
 *   trailer << /Size /Root /Info /ID /Prev >>
 *   startxref / %%EOF
 *
 * The original bytes are left untouched, /Prev points at the previous
 * startxref. Everything is serialized before the file is opened for
 * appending, so a failure while serializing leaves the file as it was.
 */
class IncrementalWriter {
 public:
  explicit IncrementalWriter(std::string filename);

  void append(QPDF& pdf, std::map<QPDFObjGen, QPDFObjectHandle> const& objects);

  /** The offset after the last "startxref" keyword in data, or -1. */
  static long long find_startxref(std::string const& data);

 private:
  std::string serialize_object(QPDFObjectHandle oh) const;
  std::string read_tail(size_t max_bytes, long long& file_size) const;

  std::string m_filename;
};

}  // namespace pdf_a11y
