#pragma once

#define POINTERHOLDER_TRANSITION 1

#include "document_handle.hpp"
#include "engine_options.hpp"
#include "fix_actions.hpp"
#include "token_editor.hpp"

#include <string>
#include <vector>

namespace pdf_a11y {

/**
 * State shared by the fix appliers of one write session. Appliers report
 * through change() and warning(); an exception escaping an applier is a
 * fatal session error.
 */
struct FixContext {
  FixContext(DocumentHandle& doc, EngineOptions const& options, PdfWriteResult& result);

  void change(std::string const& msg);
  void warning(std::string const& msg);

  DocumentHandle& doc;
  EngineOptions const& options;
  PdfWriteResult& result;
  Log log;
};

/** Top edge of the page's media box, for flipping parser coordinates. */
double page_top(QPDFObjectHandle page);

/** A parser bounding box for page index in PDF user space. */
BBox to_user_space(DocumentHandle& doc, int page_index, ParserBBox const& bbox);

bool valid_page(DocumentHandle& doc, int page_index);

// ---- Tier 1: structure and metadata, no rendering -------------------------

void apply_metadata(FixContext& ctx, Metadata const& metadata);

void apply_alt_texts(FixContext& ctx, std::vector<AltTextAction> const& alt_texts,
                     std::vector<DecorativeAction> const& decorative);

/** Rewrites /Alt of existing figures whose text is missing, short or a file name. */
void update_figure_alt_texts(FixContext& ctx, std::vector<AltTextAction> const& alt_texts);

void apply_tables(FixContext& ctx, std::vector<TableAction> const& tables);

void apply_links(FixContext& ctx, std::vector<LinkAction> const& links);

// ---- Tier 2: content stream edits, verified by rendering ------------------

void apply_headings(FixContext& ctx, std::vector<HeadingAction> const& headings);

void apply_contrast(FixContext& ctx, std::vector<ColorFix> const& fixes);

}  // namespace pdf_a11y
