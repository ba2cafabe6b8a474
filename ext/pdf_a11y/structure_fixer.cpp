#include "fixers.hpp"
#include "pdf_text.hpp"
#include "struct_tree.hpp"

#include <algorithm>
#include <stdexcept>

namespace pdf_a11y {

static void tag_table(FixContext& ctx, QPDFObjectHandle root, TableAction const& t) {
  bool on_page = valid_page(ctx.doc, t.page);

  QPDFObjectHandle table = new_struct_elem(ctx.doc, root, "/Table");
  if (on_page) {
    table.replaceKey("/Pg", ctx.doc.page(t.page));
    if (t.bbox) set_layout_bbox(table, to_user_space(ctx.doc, t.page, *t.bbox));
  }

  int header_rows = std::max(0, t.header_rows);
  int row_count = 0;
  int cell_count = 0;

  for (size_t r = 0; r < t.rows.size(); ++r) {
    auto const& cells = t.rows[r];
    if (cells.empty()) continue;

    bool header = static_cast<int>(r) < header_rows;
    QPDFObjectHandle tr = new_struct_elem(ctx.doc, table, "/TR");

    for (auto const& cell : cells) {
      QPDFObjectHandle elem = new_struct_elem(ctx.doc, tr, header ? "/TH" : "/TD");
      elem.replaceKey("/ActualText", make_text_string(cell.text));
      if (header) elem.replaceKey("/Scope", QPDFObjectHandle::newName("/Column"));
      if (cell.grid_span > 1) elem.replaceKey("/ColSpan", QPDFObjectHandle::newInteger(cell.grid_span));
      if (on_page) elem.replaceKey("/Pg", ctx.doc.page(t.page));
      ++cell_count;
    }
    ++row_count;
  }

  ++ctx.result.tags_applied;
  ctx.change("Tagged table " + t.table_id + " on page " + std::to_string(t.page) + " with " +
             std::to_string(header_rows) + " header row(s) (" + std::to_string(row_count) + " rows, " +
             std::to_string(cell_count) + " cells)");
}

void apply_tables(FixContext& ctx, std::vector<TableAction> const& tables) {
  if (tables.empty()) return;
  QPDFObjectHandle root = ensure_struct_tree(ctx.doc);

  for (auto const& t : tables) {
    try {
      tag_table(ctx, root, t);
    } catch (std::exception& e) {
      ctx.warning("Failed to tag table " + t.table_id + ": " + e.what());
    }
  }
}

// The Link annotation on page whose URI action targets url.
static QPDFObjectHandle find_link_annotation(QPDFObjectHandle page, std::string const& url) {
  QPDFObjectHandle annots = page.getKey("/Annots");
  if (url.empty() || !annots.isArray()) return QPDFObjectHandle();

  for (auto& annot : annots.getArrayAsVector()) {
    if (!annot.isIndirect() || !annot.isDictionary()) continue;
    if (!annot.getKey("/Subtype").isNameAndEquals("/Link")) continue;

    QPDFObjectHandle uri = annot.getKey("/A").getKeyIfDict("/URI");
    if (uri.isString() && uri.getUTF8Value() == url) return annot;
  }
  return QPDFObjectHandle();
}

static void tag_link(FixContext& ctx, QPDFObjectHandle root, LinkAction const& l) {
  std::string id = l.link_id.empty() ? "link" : l.link_id;

  QPDFObjectHandle elem = new_struct_elem(ctx.doc, root, "/Link");
  elem.replaceKey("/Alt", make_text_string(l.link_text));
  elem.replaceKey("/ActualText", make_text_string(l.link_text));

  if (valid_page(ctx.doc, l.page)) {
    QPDFObjectHandle page = ctx.doc.page(l.page);
    elem.replaceKey("/Pg", page);
    if (l.bbox) set_layout_bbox(elem, to_user_space(ctx.doc, l.page, *l.bbox));

    QPDFObjectHandle annot = find_link_annotation(page, l.link_url);
    if (annot.isInitialized()) {
      QPDFObjectHandle objr = QPDFObjectHandle::newDictionary();
      objr.replaceKey("/Type", QPDFObjectHandle::newName("/OBJR"));
      objr.replaceKey("/Obj", annot);
      objr.replaceKey("/Pg", page);
      elem.replaceKey("/K", objr);
    }
  }

  ++ctx.result.tags_applied;
  ctx.change("Set link text on " + id + " page " + std::to_string(l.page) + ": " + truncate_text(l.link_text, 60));
}

void apply_links(FixContext& ctx, std::vector<LinkAction> const& links) {
  if (links.empty()) return;
  QPDFObjectHandle root = ensure_struct_tree(ctx.doc);

  for (auto const& l : links) {
    try {
      tag_link(ctx, root, l);
    } catch (std::exception& e) {
      ctx.warning("Failed to tag link " + l.link_id + ": " + e.what());
    }
  }
}

}  // namespace pdf_a11y
