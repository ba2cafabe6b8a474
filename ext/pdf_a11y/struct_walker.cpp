#include "struct_walker.hpp"
#include "struct_node.hpp"

#include <stdexcept>
#include <vector>

namespace pdf_a11y {

StructWalker::StructWalker(QPDF& pdf) {
  std::vector<QPDFObjectHandle> const& pages = pdf.getAllPages();
  for (size_t i = 0; i < pages.size(); ++i) {
    QPDFObjectHandle page = pages.at(i);
    m_page_numbers[page.getObjGen()] = static_cast<int>(i) + 1;
  }
}

std::string StructWalker::get_structure_as_string(QPDFObjectHandle const& node) {
  return StructNode::from_qpdf(node, *this)->to_string(0, *this);
}

int StructWalker::page_number_of(QPDFObjectHandle page) const {
  if (!page.isIndirect()) return -1;
  auto it = m_page_numbers.find(page.getObjGen());
  return it == m_page_numbers.end() ? -1 : it->second;
}

bool StructWalker::visit(QPDFObjectHandle node) {
  if (!node.isIndirect()) return true;
  return m_visited.insert(node.getObjGen()).second;
}

std::string dump_structure(QPDF& pdf) {
  QPDFObjectHandle struct_root = pdf.getRoot().getKey("/StructTreeRoot");
  if (!struct_root.isDictionary()) {
    throw std::runtime_error("pdf_a11y: no StructTreeRoot found");
  }

  StructWalker walker(pdf);
  return walker.get_structure_as_string(struct_root.getKey("/K"));
}

}  // namespace pdf_a11y
