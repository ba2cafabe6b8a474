#include "incremental_writer.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace pdf_a11y {

IncrementalWriter::IncrementalWriter(std::string filename) : m_filename(std::move(filename)) {}

long long IncrementalWriter::find_startxref(std::string const& data) {
  size_t pos = data.rfind("startxref");
  if (pos == std::string::npos) return -1;

  pos += 9;
  while (pos < data.size() && std::isspace(static_cast<unsigned char>(data[pos]))) ++pos;

  size_t end = pos;
  while (end < data.size() && std::isdigit(static_cast<unsigned char>(data[end]))) ++end;
  if (end == pos) return -1;

  return QUtil::string_to_ll(data.substr(pos, end - pos).c_str());
}

std::string IncrementalWriter::read_tail(size_t max_bytes, long long& file_size) const {
  std::ifstream in(m_filename, std::ios::binary | std::ios::ate);
  if (!in) throw std::runtime_error("pdf_a11y: cannot read \"" + m_filename + "\"");

  file_size = static_cast<long long>(in.tellg());
  long long start = std::max(0LL, file_size - static_cast<long long>(max_bytes));
  in.seekg(start);

  std::string tail(static_cast<size_t>(file_size - start), '\0');
  in.read(&tail[0], static_cast<std::streamsize>(tail.size()));
  if (!in) throw std::runtime_error("pdf_a11y: cannot read \"" + m_filename + "\"");
  return tail;
}

std::string IncrementalWriter::serialize_object(QPDFObjectHandle oh) const {
  auto og = oh.getObjGen();
  std::ostringstream oss;
  oss << og.getObj() << " " << og.getGen() << " obj\n";

  if (oh.isStream()) {
    // raw data keeps whatever filters the dictionary names
    std::shared_ptr<Buffer> raw = oh.getRawStreamData();
    QPDFObjectHandle dict = oh.getDict().shallowCopy();
    dict.replaceKey("/Length", QPDFObjectHandle::newInteger(static_cast<long long>(raw->getSize())));

    oss << dict.unparse() << "\nstream\n";
    oss.write(reinterpret_cast<char const*>(raw->getBuffer()), static_cast<std::streamsize>(raw->getSize()));
    oss << "\nendstream\n";
  } else {
    oss << oh.unparseResolved() << "\n";
  }
  oss << "endobj\n";
  return oss.str();
}

void IncrementalWriter::append(QPDF& pdf, std::map<QPDFObjGen, QPDFObjectHandle> const& objects) {
  long long file_size = 0;
  std::string tail = read_tail(1024, file_size);

  long long prev = find_startxref(tail);
  if (prev < 0) throw std::runtime_error("pdf_a11y: no startxref in \"" + m_filename + "\"");

  std::ostringstream out;
  if (tail.empty() || (tail.back() != '\n' && tail.back() != '\r')) out << "\n";

  long long base = file_size;
  std::vector<std::pair<QPDFObjGen, long long>> offsets;
  int max_id = 0;

  for (auto const& kv : objects) {
    offsets.emplace_back(kv.first, base + static_cast<long long>(out.tellp()));
    out << serialize_object(kv.second);
    max_id = std::max(max_id, kv.first.getObj());
  }

  long long xref_offset = base + static_cast<long long>(out.tellp());
  out << "xref\n";

  // std::map iteration gives ascending ids; split into consecutive runs
  size_t i = 0;
  while (i < offsets.size()) {
    size_t j = i + 1;
    while (j < offsets.size() && offsets[j].first.getObj() == offsets[j - 1].first.getObj() + 1) ++j;

    out << offsets[i].first.getObj() << " " << (j - i) << "\n";
    for (size_t k = i; k < j; ++k) {
      // each entry is exactly 20 bytes
      out << std::setw(10) << std::setfill('0') << offsets[k].second << " " << std::setw(5) << std::setfill('0')
          << offsets[k].first.getGen() << " n\r\n";
    }
    i = j;
  }

  QPDFObjectHandle old_trailer = pdf.getTrailer();
  long long size = max_id + 1;
  if (old_trailer.getKey("/Size").isInteger()) size = std::max(size, old_trailer.getKey("/Size").getIntValue());

  QPDFObjectHandle trailer = QPDFObjectHandle::newDictionary();
  trailer.replaceKey("/Size", QPDFObjectHandle::newInteger(size));
  for (char const* key : {"/Root", "/Info", "/ID"}) {
    if (old_trailer.hasKey(key)) trailer.replaceKey(key, old_trailer.getKey(key));
  }
  trailer.replaceKey("/Prev", QPDFObjectHandle::newInteger(prev));

  out << "trailer\n" << trailer.unparse() << "\nstartxref\n" << xref_offset << "\n%%EOF\n";

  std::string bytes = out.str();
  std::ofstream file(m_filename, std::ios::binary | std::ios::app);
  if (!file) throw std::runtime_error("pdf_a11y: cannot append to \"" + m_filename + "\"");
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file) throw std::runtime_error("pdf_a11y: failed to append update to \"" + m_filename + "\"");
}

}  // namespace pdf_a11y
