#include "struct_node.hpp"

namespace pdf_a11y {

void FigureNode::add_extra_attributes(std::ostringstream& oss) {
  QPDFObjectHandle xref = node.getKey("/A11yXref");
  if (xref.isInteger()) {
    oss << " Image=\"" << xref.getIntValue() << "\"";
  }
}

}  // namespace pdf_a11y
