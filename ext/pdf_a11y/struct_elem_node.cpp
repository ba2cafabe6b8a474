#include "pdf_text.hpp"
#include "struct_node.hpp"
#include "struct_walker.hpp"

namespace pdf_a11y {

std::string StructElemNode::to_string(int level, StructWalker& walker) {
  std::ostringstream oss;
  std::string tag = structure_tag();

  print_opening_tag(oss, level, tag, find_page_number(walker));
  process_children(oss, level + 1, walker);

  IndentHelper::indent(oss, level);
  oss << "</" << tag << ">" << std::endl;

  return oss.str();
}

std::string StructElemNode::structure_tag() {
  QPDFObjectHandle s = node.getKey("/S");
  return s.isName() ? strip_slash(s.getName()) : "Unknown";
}

// Nearest /Pg on this element or one of its parents.
int StructElemNode::find_page_number(StructWalker& walker) {
  QPDFObjectHandle current = node;

  for (int depth = 0; current.isDictionary() && depth < StructWalker::MAX_DEPTH; ++depth) {
    int page_num = walker.page_number_of(current.getKey("/Pg"));
    if (page_num > 0) return page_num;
    current = current.getKey("/P");
  }
  return -1;
}

void StructElemNode::print_opening_tag(std::ostringstream& oss, int level, std::string const& tag, int page_num) {
  IndentHelper::indent(oss, level);
  oss << "<" << tag;

  if (node.isIndirect()) {
    oss << " obj=\"" << node.getObjectID() << " " << node.getGeneration() << "\"";
  }

  add_text_attribute(oss, "/Alt", "Alt");
  add_text_attribute(oss, "/ActualText", "ActualText");
  add_text_attribute(oss, "/T", "Title");
  add_text_attribute(oss, "/Lang", "Lang");

  add_class_attribute(oss);
  add_table_attributes(oss);
  add_bbox_attribute(oss);
  add_extra_attributes(oss);

  if (page_num > 0) {
    oss << " Page=\"" << page_num << "\"";
  }

  oss << ">" << std::endl;
}

void StructElemNode::add_text_attribute(std::ostringstream& oss, std::string const& key,
                                        std::string const& attribute_name) {
  QPDFObjectHandle value = node.getKey(key);
  if (value.isString()) {
    oss << " " << attribute_name << "=\"" << xml_escape(text_string_value(value)) << "\"";
  }
}

void StructElemNode::add_class_attribute(std::ostringstream& oss) {
  QPDFObjectHandle class_obj = node.getKey("/C");
  if (class_obj.isNull()) return;

  oss << " Class=\"";
  if (class_obj.isName()) {
    oss << strip_slash(class_obj.getName());
  } else if (class_obj.isArray()) {
    for (int i = 0; i < class_obj.getArrayNItems(); ++i) {
      if (i > 0) oss << " ";
      if (class_obj.getArrayItem(i).isName()) oss << strip_slash(class_obj.getArrayItem(i).getName());
    }
  }
  oss << "\"";
}

void StructElemNode::add_table_attributes(std::ostringstream& oss) {
  QPDFObjectHandle scope = node.getKey("/Scope");
  if (scope.isName()) oss << " Scope=\"" << strip_slash(scope.getName()) << "\"";

  QPDFObjectHandle col_span = node.getKey("/ColSpan");
  if (col_span.isInteger()) oss << " ColSpan=\"" << col_span.getIntValue() << "\"";
}

static bool is_layout_bbox(QPDFObjectHandle attrs) {
  return attrs.isDictionary() && attrs.getKey("/BBox").isRectangle() &&
         (attrs.getKey("/O").isNull() || attrs.getKey("/O").isNameAndEquals("/Layout"));
}

void StructElemNode::add_bbox_attribute(std::ostringstream& oss) {
  QPDFObjectHandle layout;
  QPDFObjectHandle a = node.getKey("/A");

  if (is_layout_bbox(a)) {
    layout = a;
  } else if (a.isArray()) {
    for (auto& item : a.getArrayAsVector()) {
      if (is_layout_bbox(item)) {
        layout = item;
        break;
      }
    }
  }
  if (!layout.isInitialized()) return;

  auto bbox = layout.getKey("/BBox").getArrayAsVector();
  oss << " BBox=\"[" << bbox[0].getNumericValue() << ", " << bbox[1].getNumericValue() << ", "
      << bbox[2].getNumericValue() << ", " << bbox[3].getNumericValue() << "]\"";
}

void StructElemNode::process_children(std::ostringstream& oss, int level, StructWalker& walker) {
  QPDFObjectHandle kids = node.getKey("/K");
  if (kids.isNull()) return;

  if (level > StructWalker::MAX_DEPTH) {
    IndentHelper::indent(oss, level);
    oss << "[...]" << std::endl;
    return;
  }

  oss << StructNode::from_qpdf(kids, walker)->to_string(level, walker);
}

}  // namespace pdf_a11y
