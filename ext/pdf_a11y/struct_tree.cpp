#include "struct_tree.hpp"
#include "pdf_text.hpp"

#include <algorithm>
#include <cctype>

namespace pdf_a11y {

bool is_tagged(QPDF& pdf) { return pdf.getRoot().getKey("/StructTreeRoot").isDictionary(); }

QPDFObjectHandle ensure_struct_tree(DocumentHandle& doc) {
  QPDFObjectHandle catalog = doc.qpdf().getRoot();
  QPDFObjectHandle root = catalog.getKey("/StructTreeRoot");

  if (root.isDictionary()) {
    if (!root.isIndirect()) {
      root = doc.make_indirect(root);
      catalog.replaceKey("/StructTreeRoot", root);
      doc.mark_dirty(catalog);
    }
    return root;
  }

  QPDFObjectHandle dict = QPDFObjectHandle::newDictionary();
  dict.replaceKey("/Type", QPDFObjectHandle::newName("/StructTreeRoot"));
  dict.replaceKey("/K", QPDFObjectHandle::newArray());
  root = doc.make_indirect(dict);

  QPDFObjectHandle mark_info = QPDFObjectHandle::newDictionary();
  mark_info.replaceKey("/Marked", QPDFObjectHandle::newBool(true));

  catalog.replaceKey("/StructTreeRoot", root);
  catalog.replaceKey("/MarkInfo", mark_info);
  doc.mark_dirty(catalog);
  return root;
}

void append_kid(DocumentHandle& doc, QPDFObjectHandle parent, QPDFObjectHandle kid) {
  QPDFObjectHandle k = parent.getKey("/K");

  if (k.isArray()) {
    k.appendItem(kid);
    if (k.isIndirect()) doc.mark_dirty(k);
  } else if (k.isNull()) {
    parent.replaceKey("/K", QPDFObjectHandle::newArray(std::vector<QPDFObjectHandle>{kid}));
  } else {
    // bare reference, inline dictionary or MCID: original first
    parent.replaceKey("/K", QPDFObjectHandle::newArray(std::vector<QPDFObjectHandle>{k, kid}));
  }

  if (parent.isIndirect()) doc.mark_dirty(parent);
}

QPDFObjectHandle new_struct_elem(DocumentHandle& doc, QPDFObjectHandle parent, std::string const& type) {
  QPDFObjectHandle dict = QPDFObjectHandle::newDictionary();
  dict.replaceKey("/Type", QPDFObjectHandle::newName("/StructElem"));
  dict.replaceKey("/S", QPDFObjectHandle::newName(type));
  dict.replaceKey("/P", parent);

  QPDFObjectHandle elem = doc.make_indirect(dict);
  append_kid(doc, parent, elem);
  return elem;
}

std::string heading_tag(int level) { return "H" + std::to_string(std::min(6, std::max(1, level))); }

QPDFObjectHandle add_heading(DocumentHandle& doc, QPDFObjectHandle root, std::string const& tag,
                             QPDFObjectHandle page, int mcid) {
  QPDFObjectHandle mcr = QPDFObjectHandle::newDictionary();
  mcr.replaceKey("/Type", QPDFObjectHandle::newName("/MCR"));
  mcr.replaceKey("/MCID", QPDFObjectHandle::newInteger(mcid));
  mcr.replaceKey("/Pg", page);

  QPDFObjectHandle elem = new_struct_elem(doc, root, "/" + tag);
  elem.replaceKey("/K", mcr);
  return elem;
}

void set_layout_bbox(QPDFObjectHandle elem, std::array<double, 4> const& bbox) {
  QPDFObjectHandle attrs = QPDFObjectHandle::newDictionary();
  attrs.replaceKey("/O", QPDFObjectHandle::newName("/Layout"));

  QPDFObjectHandle arr = QPDFObjectHandle::newArray();
  for (double v : bbox) arr.appendItem(QPDFObjectHandle::newReal(v, 2));
  attrs.replaceKey("/BBox", arr);

  elem.replaceKey("/A", attrs);
}

QPDFObjectHandle add_figure(DocumentHandle& doc, QPDFObjectHandle root, FigureSpec const& spec) {
  QPDFObjectHandle fig = new_struct_elem(doc, root, "/Figure");
  fig.replaceKey("/Alt", make_text_string(spec.alt));

  if (spec.page.isInitialized()) fig.replaceKey("/Pg", spec.page);
  if (spec.xref) fig.replaceKey("/A11yXref", QPDFObjectHandle::newInteger(*spec.xref));
  if (spec.bbox) set_layout_bbox(fig, *spec.bbox);
  return fig;
}

static void collect(QPDFObjectHandle node, QPDFObjectHandle owner, std::string const& type, int depth, int max_depth,
                    std::set<QPDFObjGen>& visited, std::vector<FoundElement>& out) {
  if (depth >= max_depth) return;

  if (node.isIndirect()) {
    if (!visited.insert(node.getObjGen()).second) return;
    owner = node;
  }
  if (!node.isDictionary()) return;

  if (node.getKey("/S").isNameAndEquals(type)) out.push_back({node, owner});

  QPDFObjectHandle kids = node.getKey("/K");
  if (kids.isArray()) {
    // inline children of an indirect array are rewritten with the array
    QPDFObjectHandle kid_owner = kids.isIndirect() ? kids : owner;
    if (kids.isIndirect() && !visited.insert(kids.getObjGen()).second) return;

    for (int i = 0; i < kids.getArrayNItems(); ++i) {
      QPDFObjectHandle kid = kids.getArrayItem(i);
      if (kid.isDictionary()) collect(kid, kid_owner, type, depth + 1, max_depth, visited, out);
    }
  } else if (kids.isDictionary()) {
    collect(kids, owner, type, depth + 1, max_depth, visited, out);
  }
}

std::vector<FoundElement> find_elements_by_type(QPDFObjectHandle root, std::string const& type, int max_depth) {
  std::vector<FoundElement> found;
  std::set<QPDFObjGen> visited;
  collect(root, root, type, 0, max_depth, visited, found);
  return found;
}

// ---- figure matching ------------------------------------------------------

static bool is_image(QPDFObjectHandle oh) {
  return oh.isStream() && oh.getDict().getKey("/Subtype").isNameAndEquals("/Image");
}

static std::vector<QPDFObjectHandle> kids_of(QPDFObjectHandle elem) {
  QPDFObjectHandle k = elem.getKey("/K");
  if (k.isArray()) return k.getArrayAsVector();
  if (k.isNull()) return {};
  return {k};
}

FigureMatcher::FigureMatcher(QPDF& pdf, ImageLocator const& locator) : m_locator(locator) {
  auto const& pages = pdf.getAllPages();
  for (size_t i = 0; i < pages.size(); ++i) {
    QPDFObjectHandle page = pages[i];
    m_page_numbers[page.getObjGen()] = static_cast<int>(i);
  }
}

int FigureMatcher::page_index_of(QPDFObjectHandle page) const {
  if (!page.isIndirect()) return -1;
  auto it = m_page_numbers.find(page.getObjGen());
  return it == m_page_numbers.end() ? -1 : it->second;
}

// nullopt when another figure already took the image
std::optional<QPDFObjGen> FigureMatcher::claim(QPDFObjGen image) {
  if (!m_claimed.insert(image).second) return std::nullopt;
  return image;
}

std::optional<QPDFObjGen> FigureMatcher::match_marked_content(QPDFObjectHandle figure, int page_index) {
  for (auto& kid : kids_of(figure)) {
    int mcid = -1;
    int kid_page = page_index;

    if (kid.isInteger()) {
      mcid = kid.getIntValueAsInt();
    } else if (kid.isDictionary() && kid.getKey("/Type").isNameAndEquals("/MCR") && kid.getKey("/MCID").isInteger()) {
      mcid = kid.getKey("/MCID").getIntValueAsInt();
      if (kid.hasKey("/Pg")) kid_page = page_index_of(kid.getKey("/Pg"));
    }
    if (mcid < 0 || kid_page < 0) continue;

    for (auto const& img : m_locator.images()) {
      if (img.page_index == kid_page && img.mcid == mcid && !m_claimed.count(img.image)) return claim(img.image);
    }
  }
  return std::nullopt;
}

std::optional<QPDFObjGen> FigureMatcher::match(QPDFObjectHandle figure) {
  QPDFObjectHandle breadcrumb = figure.getKey("/A11yXref");
  if (breadcrumb.isInteger()) {
    int id = breadcrumb.getIntValueAsInt();
    if (auto located = m_locator.locate(id)) return claim(located->image);
    return claim(QPDFObjGen(id, 0));
  }

  for (auto& kid : kids_of(figure)) {
    if (kid.isDictionary() && kid.getKey("/Type").isNameAndEquals("/OBJR")) {
      QPDFObjectHandle obj = kid.getKey("/Obj");
      if (obj.isIndirect() && is_image(obj)) return claim(obj.getObjGen());
    }
  }

  int page_index = page_index_of(figure.getKey("/Pg"));

  if (auto by_mcid = match_marked_content(figure, page_index)) return by_mcid;

  if (page_index >= 0) {
    for (auto const& img : m_locator.images()) {
      if (img.page_index == page_index && !m_claimed.count(img.image)) return claim(img.image);
    }
  }
  return std::nullopt;
}

// ---- maintenance ----------------------------------------------------------

bool strip_struct_tree(DocumentHandle& doc) {
  QPDFObjectHandle catalog = doc.qpdf().getRoot();
  if (!catalog.hasKey("/StructTreeRoot") && !catalog.hasKey("/MarkInfo")) return false;

  catalog.removeKey("/StructTreeRoot");
  catalog.removeKey("/MarkInfo");
  doc.mark_dirty(catalog);
  return true;
}

static bool ends_with(std::string const& s, std::string const& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_filename_alt(std::string const& text) {
  size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return false;
  size_t last = text.find_last_not_of(" \t\r\n");
  std::string trimmed = text.substr(first, last - first + 1);

  std::string lower = to_lower_ascii(trimmed);
  for (char const* ext : {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".svg"}) {
    if (ends_with(lower, ext)) return true;
  }

  if (trimmed.rfind("Screen Shot ", 0) == 0 || trimmed.rfind("image", 0) == 0) return true;

  // very short dotted strings are usually generated names
  return trimmed.size() < 10 && trimmed.find('.') != std::string::npos;
}

}  // namespace pdf_a11y
