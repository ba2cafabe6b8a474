#include "content_tokenizer.hpp"
#include "fixers.hpp"
#include "page_contents.hpp"
#include "pdf_text.hpp"
#include "visual_verifier.hpp"

#include <qpdf/QUtil.hh>

#include <memory>
#include <stdexcept>

namespace pdf_a11y {

namespace {

struct ColorPair {
  std::string label;  // "#RRGGBB -> #RRGGBB"
  RGB original;
  RGB fixed;
};

std::vector<ColorPair> valid_pairs(FixContext& ctx, std::vector<ColorFix> const& fixes) {
  std::vector<ColorPair> pairs;
  for (auto const& fix : fixes) {
    std::string label = fix.original_hex + " -> " + fix.fixed_hex;
    auto original = hex_to_rgb(fix.original_hex);
    auto fixed = hex_to_rgb(fix.fixed_hex);

    if (!original || !fixed) {
      ctx.warning("Ignored color fix " + label + ": colors must be #RRGGBB");
      continue;
    }
    if (to_lower_ascii(fix.original_hex) == to_lower_ascii(fix.fixed_hex)) {
      ctx.warning("Ignored color fix " + label + ": original equals fix");
      continue;
    }
    pairs.push_back({label, *original, *fixed});
  }
  return pairs;
}

}  // namespace

void apply_contrast(FixContext& ctx, std::vector<ColorFix> const& fixes) {
  if (fixes.empty()) return;

  std::vector<ColorPair> pairs = valid_pairs(ctx, fixes);
  if (pairs.empty()) return;

  std::unique_ptr<VisualVerifier> verifier;
  if (ctx.options.verify_visually) verifier.reset(new VisualVerifier(ctx.doc, ctx.options));

  auto const& pages = ctx.doc.pages();
  for (size_t i = 0; i < pages.size(); ++i) {
    int page_index = static_cast<int>(i);
    std::string where = " on page " + std::to_string(page_index);

    PageContents contents(ctx.doc, pages[i]);
    TokenList tokens = ContentTokenizer::tokenize(contents.read());

    size_t replaced = 0;
    std::vector<std::string> page_changes;
    for (auto const& pair : pairs) {
      size_t n = replace_color(tokens, pair.original, pair.fixed, ctx.options.color_tolerance);
      if (n == 0) continue;
      replaced += n;
      page_changes.push_back("Changed color " + pair.label + where + " (" + std::to_string(n) + " operators)");
    }
    if (replaced == 0) continue;

    PageContents::Snapshot snap = contents.snapshot();
    try {
      RasterImage before;
      if (verifier) before = verifier->render_page(page_index);

      contents.write(reassemble(tokens));

      if (verifier) {
        double diff = verifier->diff_percent(before, verifier->render_page(page_index));
        if (diff > ctx.options.contrast_tolerance_percent) {
          contents.restore(snap);
          ctx.warning("Reverted contrast fixes" + where + ": " + QUtil::double_to_string(diff, 2) +
                      "% of the page changed");
          continue;
        }
      }
    } catch (std::exception& e) {
      contents.restore(snap);
      ctx.warning("Reverted contrast fixes" + where + ": " + e.what());
      continue;
    }

    for (auto const& msg : page_changes) ctx.change(msg);
    ctx.result.contrast_fixes_applied += static_cast<int>(replaced);
  }
}

}  // namespace pdf_a11y
