#include "fixers.hpp"
#include "pdf_text.hpp"

namespace pdf_a11y {

// The trailer's /Info dictionary as an indirect object, created when missing.
static QPDFObjectHandle info_dictionary(DocumentHandle& doc) {
  QPDFObjectHandle trailer = doc.qpdf().getTrailer();
  QPDFObjectHandle info = trailer.getKey("/Info");

  if (info.isDictionary() && info.isIndirect()) return info;

  info = doc.make_indirect(info.isDictionary() ? info : QPDFObjectHandle::newDictionary());
  trailer.replaceKey("/Info", info);
  doc.mark_trailer_changed();
  return info;
}

static void set_title(FixContext& ctx, std::string const& title) {
  QPDFObjectHandle trailer = ctx.doc.qpdf().getTrailer();
  QPDFObjectHandle current = trailer.getKey("/Info").getKeyIfDict("/Title");

  if (text_string_value(current) == title) {
    ctx.change("Title unchanged: " + title);
  } else {
    QPDFObjectHandle info = info_dictionary(ctx.doc);
    info.replaceKey("/Title", make_text_string(title));
    ctx.doc.mark_dirty(info);
    ctx.change("Set PDF title: " + title);
  }

  QPDFObjectHandle catalog = ctx.doc.qpdf().getRoot();
  QPDFObjectHandle prefs = catalog.getKey("/ViewerPreferences");
  QPDFObjectHandle display = prefs.getKeyIfDict("/DisplayDocTitle");
  if (display.isBool() && display.getBoolValue()) return;

  if (!prefs.isDictionary()) {
    prefs = QPDFObjectHandle::newDictionary();
    catalog.replaceKey("/ViewerPreferences", prefs);
  }
  prefs.replaceKey("/DisplayDocTitle", QPDFObjectHandle::newBool(true));
  ctx.doc.mark_dirty(prefs.isIndirect() ? prefs : catalog);
  ctx.change("Set DisplayDocTitle");
}

static void set_language(FixContext& ctx, std::string const& language) {
  QPDFObjectHandle catalog = ctx.doc.qpdf().getRoot();

  if (text_string_value(catalog.getKey("/Lang")) == language) {
    ctx.change("Language unchanged: " + language);
    return;
  }

  catalog.replaceKey("/Lang", make_text_string(language));
  ctx.doc.mark_dirty(catalog);
  ctx.change("Set PDF language: " + language);
}

void apply_metadata(FixContext& ctx, Metadata const& metadata) {
  if (!metadata.title.empty()) set_title(ctx, metadata.title);
  if (!metadata.language.empty()) set_language(ctx, metadata.language);
}

}  // namespace pdf_a11y
