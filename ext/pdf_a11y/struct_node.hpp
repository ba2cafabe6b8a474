#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <qpdf/QPDFObjectHandle.hh>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace pdf_a11y {

class StructWalker;

/**
 * One node of the logical structure as it is printed by StructWalker:
 * an XML-like outline with one element per line.
 */
class StructNode {
 public:
  virtual ~StructNode() = default;
  virtual std::string to_string(int level, StructWalker& walker) = 0;

  static std::unique_ptr<StructNode> from_qpdf(QPDFObjectHandle node, StructWalker& walker);
};

class StructElemNode : public StructNode {
 protected:
  QPDFObjectHandle node;

 public:
  StructElemNode(QPDFObjectHandle n) : node(n) {}
  std::string to_string(int level, StructWalker& walker) override;

 protected:
  virtual void add_extra_attributes(std::ostringstream& oss) {}

 private:
  std::string structure_tag();
  int find_page_number(StructWalker& walker);
  void print_opening_tag(std::ostringstream& oss, int level, std::string const& tag, int page_num);
  void add_text_attribute(std::ostringstream& oss, std::string const& key, std::string const& attribute_name);
  void add_class_attribute(std::ostringstream& oss);
  void add_bbox_attribute(std::ostringstream& oss);
  void add_table_attributes(std::ostringstream& oss);
  void process_children(std::ostringstream& oss, int level, StructWalker& walker);
};

class FigureNode : public StructElemNode {
 public:
  FigureNode(QPDFObjectHandle n) : StructElemNode(n) {}

 protected:
  void add_extra_attributes(std::ostringstream& oss) override;
};

class McidNode : public StructNode {
 private:
  int mcid;

 public:
  McidNode(int id) : mcid(id) {}
  std::string to_string(int level, StructWalker& walker) override;
};

class McrNode : public StructNode {
 public:
  McrNode(int mcid, int page_number) : mcid(mcid), page_number(page_number) {}
  std::string to_string(int level, StructWalker& walker) override;

 private:
  int mcid;
  int page_number;  // 1-based, -1 when unknown
};

/** /OBJR reference to an annotation or XObject. */
class ObjrNode : public StructNode {
 public:
  ObjrNode(QPDFObjGen obj, std::string subtype, int page_number)
      : obj(obj), subtype(std::move(subtype)), page_number(page_number) {}
  std::string to_string(int level, StructWalker& walker) override;

 private:
  QPDFObjGen obj;
  std::string subtype;
  int page_number;
};

class ArrayNode : public StructNode {
 private:
  std::vector<std::unique_ptr<StructNode>> children;

 public:
  ArrayNode() = default;
  void add_child(std::unique_ptr<StructNode> child);
  std::string to_string(int level, StructWalker& walker) override;
};

class UnknownNode : public StructNode {
 private:
  std::string type_name;

 public:
  UnknownNode(std::string const& type) : type_name(type) {}
  std::string to_string(int level, StructWalker& walker) override;
};

class IndentHelper {
 public:
  static void indent(std::ostream& out, int level) {
    for (int i = 0; i < level; ++i) {
      out << "  ";
    }
  }
};

/** Escapes & < > and " for use in an attribute value. */
std::string xml_escape(std::string const& text);

/** "/Figure" -> "Figure" */
std::string strip_slash(std::string const& name);

}  // namespace pdf_a11y
