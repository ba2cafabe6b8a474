#include "fixers.hpp"
#include "image_locator.hpp"
#include "pdf_text.hpp"
#include "struct_tree.hpp"

#include <deque>
#include <map>
#include <set>
#include <stdexcept>

namespace pdf_a11y {

namespace {

struct ImageTarget {
  std::string id;
  std::string alt;
  bool decorative = false;
  std::optional<int> xref;
  std::optional<int> page;
  std::optional<ParserBBox> bbox;
  bool handled = false;
};

std::vector<ImageTarget> collect_targets(std::vector<AltTextAction> const& alt_texts,
                                         std::vector<DecorativeAction> const& decorative) {
  std::vector<ImageTarget> targets;
  std::set<std::string> decorative_ids;
  for (auto const& d : decorative) decorative_ids.insert(d.image_id);

  for (auto const& a : alt_texts) {
    if (decorative_ids.count(a.image_id)) continue;
    ImageTarget t;
    t.id = a.image_id;
    t.alt = a.alt_text;
    t.xref = a.xref;
    t.page = a.page;
    t.bbox = a.bbox;
    targets.push_back(t);
  }
  for (auto const& d : decorative) {
    ImageTarget t;
    t.id = d.image_id;
    t.decorative = true;
    t.xref = d.xref;
    t.page = d.page;
    targets.push_back(t);
  }
  return targets;
}

ImageLocator locate_images(FixContext& ctx) {
  ImageLocator locator;
  try {
    locator.find(ctx.doc.qpdf());
  } catch (std::exception& e) {
    ctx.warning(std::string("Could not locate images in page content: ") + e.what());
  }
  return locator;
}

std::string describe(ImageTarget const& t, QPDFObjectHandle elem) {
  std::string where = elem.isIndirect() ? " (obj " + std::to_string(elem.getObjectID()) + ")" : "";
  if (t.decorative) return "Marked " + t.id + " as decorative" + where;
  return "Set alt text on " + t.id + where + ": " + truncate_text(t.alt, 60);
}

ImageTarget* by_xref(std::vector<ImageTarget>& targets, QPDFObjGen image) {
  for (auto& t : targets) {
    if (!t.handled && t.xref && *t.xref == image.getObj()) return &t;
  }
  return nullptr;
}

// Next pending target on page whose image cannot be placed by object id.
ImageTarget* by_page(std::vector<ImageTarget>& targets, ImageLocator const& locator, int page_index) {
  for (auto& t : targets) {
    if (t.handled || !t.page || *t.page != page_index) continue;
    if (t.xref && locator.locate(*t.xref)) continue;
    return &t;
  }
  return nullptr;
}

void update_tagged(FixContext& ctx, std::vector<ImageTarget>& targets, ImageLocator const& locator) {
  QPDF& pdf = ctx.doc.qpdf();
  QPDFObjectHandle root = ensure_struct_tree(ctx.doc);
  FigureMatcher matcher(pdf, locator);

  for (auto& found : find_elements_by_type(root, "/Figure")) {
    ImageTarget* target = nullptr;
    if (auto image = matcher.match(found.elem)) target = by_xref(targets, *image);
    if (!target) {
      int page_index = matcher.page_index_of(found.elem.getKey("/Pg"));
      if (page_index >= 0) target = by_page(targets, locator, page_index);
    }
    if (!target) continue;

    found.elem.replaceKey("/Alt", make_text_string(target->decorative ? "" : target->alt));
    ctx.doc.mark_dirty(found.owner);
    target->handled = true;
    ++ctx.result.tags_applied;
    ctx.change(describe(*target, found.elem));
  }
}

void create_figures(FixContext& ctx, std::vector<ImageTarget*> const& targets, ImageLocator const& locator) {
  if (targets.empty()) return;
  QPDFObjectHandle root = ensure_struct_tree(ctx.doc);

  for (ImageTarget* t : targets) {
    try {
      FigureSpec spec;
      spec.alt = t->decorative ? "" : t->alt;
      spec.xref = t->xref;

      std::optional<ImageLocation> located;
      if (t->xref) located = locator.locate(*t->xref);

      int page_index = t->page ? *t->page : (located ? located->page_index : -1);
      if (valid_page(ctx.doc, page_index)) spec.page = ctx.doc.page(page_index);

      if (located) {
        spec.bbox = located->bbox;
      } else if (t->bbox && valid_page(ctx.doc, page_index)) {
        spec.bbox = to_user_space(ctx.doc, page_index, *t->bbox);
      }

      add_figure(ctx.doc, root, spec);
      t->handled = true;
      ++ctx.result.tags_applied;
      if (t->decorative) {
        ctx.change("Created /Figure for " + t->id + " (decorative)");
      } else {
        ctx.change("Created /Figure for " + t->id + " with alt: " + truncate_text(t->alt, 60));
      }
    } catch (std::exception& e) {
      ctx.warning("Failed to create /Figure for " + t->id + ": " + e.what());
    }
  }
}

}  // namespace

void apply_alt_texts(FixContext& ctx, std::vector<AltTextAction> const& alt_texts,
                     std::vector<DecorativeAction> const& decorative) {
  std::vector<ImageTarget> targets = collect_targets(alt_texts, decorative);
  if (targets.empty()) return;

  ImageLocator locator = locate_images(ctx);
  bool tagged = is_tagged(ctx.doc.qpdf());
  if (tagged) update_tagged(ctx, targets, locator);

  std::vector<ImageTarget*> pending;
  std::string names;
  for (auto& t : targets) {
    if (t.handled) continue;
    pending.push_back(&t);
    names += (names.empty() ? "" : ", ") + t.id;
  }
  if (tagged && !pending.empty()) ctx.warning("Could not find struct elements for images: " + names);

  create_figures(ctx, pending, locator);
}

void update_figure_alt_texts(FixContext& ctx, std::vector<AltTextAction> const& alt_texts) {
  QPDF& pdf = ctx.doc.qpdf();
  if (!is_tagged(pdf) || alt_texts.empty()) return;

  std::map<int, AltTextAction const*> by_object;
  std::map<int, std::deque<AltTextAction const*>> by_page_index;
  for (auto const& a : alt_texts) {
    if (a.xref) by_object[*a.xref] = &a;
    if (a.page) by_page_index[*a.page].push_back(&a);
  }

  ImageLocator locator;
  FigureMatcher matcher(pdf, locator);
  QPDFObjectHandle root = ensure_struct_tree(ctx.doc);

  for (auto& found : find_elements_by_type(root, "/Figure")) {
    std::string current = text_string_value(found.elem.getKey("/Alt"));
    // a real description is left alone
    if (current.size() > 20 && !is_filename_alt(current)) continue;

    AltTextAction const* action = nullptr;
    std::string via;

    QPDFObjectHandle breadcrumb = found.elem.getKey("/A11yXref");
    if (breadcrumb.isInteger()) {
      auto it = by_object.find(breadcrumb.getIntValueAsInt());
      if (it != by_object.end()) {
        action = it->second;
        via = "A11yXref " + std::to_string(it->first);
      }
    }
    if (!action) {
      int page_index = matcher.page_index_of(found.elem.getKey("/Pg"));
      auto it = by_page_index.find(page_index);
      if (it != by_page_index.end() && !it->second.empty()) {
        action = it->second.front();
        it->second.pop_front();
        via = "page " + std::to_string(page_index);
      }
    }
    if (!action) continue;

    found.elem.replaceKey("/Alt", make_text_string(action->alt_text));
    ctx.doc.mark_dirty(found.owner);
    ++ctx.result.tags_applied;
    ctx.change("Updated alt on " + action->image_id + " (" + via + "): " + truncate_text(action->alt_text, 60));
  }
}

}  // namespace pdf_a11y
