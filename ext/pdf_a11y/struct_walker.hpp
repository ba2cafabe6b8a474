#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <map>
#include <set>
#include <string>

namespace pdf_a11y {

/**
 * Prints a document's logical structure as an indented outline:
 *
 *   <H1 obj="12 0" Page="1">
 *     [MCR: MCID=0 Page=1]
 *   </H1>
 *   <Figure obj="13 0" Alt="Campus map" BBox="[72, 400, 272, 600]" Image="7" Page="1">
 *   </Figure>
 *
 * Every structure element is printed once, so shared or cyclic /K
 * references cannot make the walk run away.
 */
class StructWalker {
 public:
  static constexpr int MAX_DEPTH = 64;

  explicit StructWalker(QPDF& pdf);

  std::string get_structure_as_string(QPDFObjectHandle const& node);

  /** 1-based page number of a page object, -1 when it is not a page of this document. */
  int page_number_of(QPDFObjectHandle page) const;

  /** Records an indirect element; false when it was printed before. */
  bool visit(QPDFObjectHandle node);

 private:
  std::map<QPDFObjGen, int> m_page_numbers;
  std::set<QPDFObjGen> m_visited;
};

/** Outline of the whole StructTreeRoot. Throws std::runtime_error for an untagged document. */
std::string dump_structure(QPDF& pdf);

}  // namespace pdf_a11y
