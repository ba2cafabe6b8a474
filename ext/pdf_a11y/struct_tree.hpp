#pragma once

#define POINTERHOLDER_TRANSITION 1

#include "document_handle.hpp"
#include "image_locator.hpp"

#include <qpdf/QPDFObjectHandle.hh>

#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pdf_a11y {

/** A structure element found in the tree, with the indirect object that has to be rewritten when it changes. */
struct FoundElement {
  QPDFObjectHandle elem;
  QPDFObjectHandle owner;  // elem itself when it is indirect, otherwise its nearest indirect ancestor
};

bool is_tagged(QPDF& pdf);

/** The catalog's StructTreeRoot, created together with MarkInfo when missing. */
QPDFObjectHandle ensure_struct_tree(DocumentHandle& doc);

/**
 * Appends kid to parent's /K. A missing /K becomes [kid], a single reference
 * or inline dictionary is promoted to [original kid].
 */
void append_kid(DocumentHandle& doc, QPDFObjectHandle parent, QPDFObjectHandle kid);

/** A new indirect /StructElem of the given type ("/Figure", "/TD", ...) linked under parent. */
QPDFObjectHandle new_struct_elem(DocumentHandle& doc, QPDFObjectHandle parent, std::string const& type);

/** "H1".."H6", out-of-range levels clamp. */
std::string heading_tag(int level);

/** A heading element whose content is the marked-content sequence mcid on page. */
QPDFObjectHandle add_heading(DocumentHandle& doc, QPDFObjectHandle root, std::string const& tag,
                             QPDFObjectHandle page, int mcid);

struct FigureSpec {
  std::string alt;
  QPDFObjectHandle page;       // uninitialized when unknown
  std::optional<int> xref;     // source image object id
  std::optional<std::array<double, 4>> bbox;  // user space
};

/** A structure-only /Figure, no marked content is wrapped. */
QPDFObjectHandle add_figure(DocumentHandle& doc, QPDFObjectHandle root, FigureSpec const& spec);

/** Sets /A << /O /Layout /BBox [...] >> on elem. */
void set_layout_bbox(QPDFObjectHandle elem, std::array<double, 4> const& bbox);

std::vector<FoundElement> find_elements_by_type(QPDFObjectHandle root, std::string const& type, int max_depth = 8);

/**
 * Matches /Figure elements to located images. Each image is handed out at
 * most once.
 */
class FigureMatcher {
 public:
  FigureMatcher(QPDF& pdf, ImageLocator const& locator);

  /**
   * The image object a figure stands for: its A11yXref breadcrumb, an /OBJR
   * child, a marked-content child enclosing the image's Do, or the next
   * unclaimed image on its /Pg page.
   */
  std::optional<QPDFObjGen> match(QPDFObjectHandle figure);

  int page_index_of(QPDFObjectHandle page) const;

 private:
  std::optional<QPDFObjGen> claim(QPDFObjGen image);
  std::optional<QPDFObjGen> match_marked_content(QPDFObjectHandle figure, int page_index);

  ImageLocator const& m_locator;
  std::map<QPDFObjGen, int> m_page_numbers;
  std::set<QPDFObjGen> m_claimed;
};

/** Drops StructTreeRoot and MarkInfo from the catalog. Returns false when there was nothing to drop. */
bool strip_struct_tree(DocumentHandle& doc);

/** True for alt text that is a file name or an auto-generated label rather than a description. */
bool is_filename_alt(std::string const& text);

}  // namespace pdf_a11y
