#include "struct_node.hpp"
#include "struct_walker.hpp"

namespace pdf_a11y {

std::unique_ptr<StructNode> StructNode::from_qpdf(QPDFObjectHandle node, StructWalker& walker) {
  if (node.isInteger()) {
    return std::make_unique<McidNode>(node.getIntValueAsInt());
  }

  if (node.isArray()) {
    auto array_node = std::make_unique<ArrayNode>();
    for (int i = 0; i < node.getArrayNItems(); ++i) {
      array_node->add_child(from_qpdf(node.getArrayItem(i), walker));
    }
    return array_node;
  }

  if (node.isDictionary()) {
    QPDFObjectHandle type = node.getKey("/Type");

    if (type.isNameAndEquals("/MCR") && node.getKey("/MCID").isInteger()) {
      return std::make_unique<McrNode>(node.getKey("/MCID").getIntValueAsInt(),
                                       walker.page_number_of(node.getKey("/Pg")));
    }

    if (type.isNameAndEquals("/OBJR")) {
      QPDFObjectHandle obj = node.getKey("/Obj");
      QPDFObjectHandle subtype = obj.isStream() ? obj.getDict().getKey("/Subtype") : obj.getKeyIfDict("/Subtype");
      return std::make_unique<ObjrNode>(obj.getObjGen(), subtype.isName() ? strip_slash(subtype.getName()) : "",
                                        walker.page_number_of(node.getKey("/Pg")));
    }

    if (node.getKey("/S").isName() || type.isNameAndEquals("/StructElem")) {
      if (!walker.visit(node)) {
        return std::make_unique<UnknownNode>("cycle to obj " + std::to_string(node.getObjectID()));
      }
      if (node.getKey("/S").isNameAndEquals("/Figure")) {
        return std::make_unique<FigureNode>(node);
      }
      return std::make_unique<StructElemNode>(node);
    }
    return std::make_unique<UnknownNode>("Dictionary");
  }

  return std::make_unique<UnknownNode>(node.getTypeName());
}

// ---- marked content and object references --------------------------------

std::string McidNode::to_string(int level, StructWalker&) {
  std::ostringstream oss;
  IndentHelper::indent(oss, level);
  oss << "[MCID: " << mcid << "]" << std::endl;
  return oss.str();
}

std::string McrNode::to_string(int level, StructWalker&) {
  std::ostringstream oss;
  IndentHelper::indent(oss, level);
  oss << "[MCR: MCID=" << mcid;
  if (page_number > 0) oss << " Page=" << page_number;
  oss << "]" << std::endl;
  return oss.str();
}

std::string ObjrNode::to_string(int level, StructWalker&) {
  std::ostringstream oss;
  IndentHelper::indent(oss, level);
  oss << "[OBJR: obj=" << obj.getObj() << " " << obj.getGen();
  if (!subtype.empty()) oss << " Subtype=" << subtype;
  if (page_number > 0) oss << " Page=" << page_number;
  oss << "]" << std::endl;
  return oss.str();
}

// ---- containers ------------------------------------------------------------

void ArrayNode::add_child(std::unique_ptr<StructNode> child) { children.push_back(std::move(child)); }

std::string ArrayNode::to_string(int level, StructWalker& walker) {
  std::string out;
  for (auto const& child : children) out += child->to_string(level, walker);
  return out;
}

std::string UnknownNode::to_string(int level, StructWalker&) {
  std::ostringstream oss;
  IndentHelper::indent(oss, level);
  oss << "[Unhandled type: " << type_name << "]" << std::endl;
  return oss.str();
}

std::string xml_escape(std::string const& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string strip_slash(std::string const& name) {
  return (!name.empty() && name[0] == '/') ? name.substr(1) : name;
}

}  // namespace pdf_a11y
