#include "content_tokenizer.hpp"
#include "fixers.hpp"
#include "page_contents.hpp"
#include "pdf_text.hpp"
#include "struct_tree.hpp"
#include "visual_verifier.hpp"

#include <qpdf/QUtil.hh>

#include <memory>
#include <stdexcept>

namespace pdf_a11y {

static std::string percent(double value) { return QUtil::double_to_string(value, 2) + "%"; }

static std::vector<TextSpan> locate_heading(FixContext& ctx, HeadingAction const& h, TokenList const& tokens) {
  std::vector<TextSpan> spans = find_text_spans(tokens, h.text);
  if (!spans.empty() || !h.bbox) return spans;

  // text drawn through CID fonts cannot be matched by content
  BBox box = to_user_space(ctx.doc, h.page, *h.bbox);
  if (auto block = find_text_block_in_bbox(tokens, box, ctx.options.bbox_tolerance)) spans.push_back(*block);
  return spans;
}

static void tag_heading(FixContext& ctx, HeadingAction const& h, VisualVerifier* verifier) {
  std::string label = "heading " + h.element_id + " \"" + truncate_text(h.text, 60) + "\"";

  if (!valid_page(ctx.doc, h.page)) {
    ctx.warning("Skipped " + label + ": page " + std::to_string(h.page) + " does not exist");
    return;
  }

  QPDFObjectHandle page = ctx.doc.page(h.page);
  PageContents contents(ctx.doc, page);
  TokenList tokens = ContentTokenizer::tokenize(contents.read());

  std::vector<TextSpan> spans = locate_heading(ctx, h, tokens);
  if (spans.empty()) {
    ctx.warning("Skipped " + label + ": text not found on page " + std::to_string(h.page));
    return;
  }

  RasterImage baseline;
  if (verifier) {
    try {
      baseline = verifier->render_page(h.page);
    } catch (std::exception& e) {
      ctx.warning("Skipped " + label + ": " + e.what());
      return;
    }
  }

  std::string const tag = heading_tag(h.level);
  int mcid = next_mcid(tokens);
  PageContents::Snapshot snap = contents.snapshot();

  for (int attempt = 0; attempt < ctx.options.max_heading_attempts; ++attempt, ++mcid) {
    TextSpan span = spans[static_cast<size_t>(attempt) % spans.size()];
    double diff = 0.0;

    try {
      contents.write(reassemble(inject_marked_content(tokens, span, mcid, tag)));
      if (verifier) diff = verifier->diff_percent(baseline, verifier->render_page(h.page));
    } catch (std::exception& e) {
      contents.restore(snap);
      ctx.warning("Gave up " + label + ": " + e.what());
      return;
    }

    if (diff <= ctx.options.heading_tolerance_percent) {
      add_heading(ctx.doc, ensure_struct_tree(ctx.doc), tag, page, mcid);
      ++ctx.result.heading_tags_applied;
      ++ctx.result.tags_applied;
      ctx.change("Tagged " + label + " as " + tag + " on page " + std::to_string(h.page) + " (MCID " +
                 std::to_string(mcid) + ")");
      return;
    }

    contents.restore(snap);
    ctx.log.warn("attempt " + std::to_string(attempt + 1) + " for " + label + " changed " + percent(diff) +
                 " of the page, reverted");
  }

  ctx.warning("Gave up " + label + " after " + std::to_string(ctx.options.max_heading_attempts) +
              " attempts: tagging changed the page's appearance");
}

void apply_headings(FixContext& ctx, std::vector<HeadingAction> const& headings) {
  if (headings.empty()) return;

  std::unique_ptr<VisualVerifier> verifier;
  if (ctx.options.verify_visually) verifier.reset(new VisualVerifier(ctx.doc, ctx.options));

  for (auto const& h : headings) tag_heading(ctx, h, verifier.get());
}

}  // namespace pdf_a11y
