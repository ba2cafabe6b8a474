#include "pdf_a11y.hpp"
#include "document_handle.hpp"
#include "pdf_write_session.hpp"
#include "struct_tree.hpp"
#include "struct_walker.hpp"
#include "tagging_plan.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>

#include <stdexcept>
#include <string>
#include <vector>

VALUE rb_mPdfA11y;
VALUE rb_cDocument;
VALUE rb_ePdfA11yError;

using namespace pdf_a11y;

static DocumentHandle* get_handle(VALUE self) {
  DocumentHandle* h;
  Data_Get_Struct(self, DocumentHandle, h);
  if (!h || h->is_closed()) rb_raise(rb_ePdfA11yError, "document is closed");
  return h;
}

static VALUE string_array(std::vector<std::string> const& items) {
  VALUE arr = rb_ary_new_capa(static_cast<long>(items.size()));
  for (auto const& s : items) rb_ary_push(arr, rb_utf8_str_new(s.data(), static_cast<long>(s.size())));
  return arr;
}

static VALUE result_to_hash(PdfWriteResult const& result) {
  VALUE hash = rb_hash_new();
  rb_hash_aset(hash, ID2SYM(rb_intern("success")), result.success ? Qtrue : Qfalse);
  rb_hash_aset(hash, ID2SYM(rb_intern("output_path")), rb_str_new_cstr(result.output_path.c_str()));
  rb_hash_aset(hash, ID2SYM(rb_intern("tags_applied")), INT2NUM(result.tags_applied));
  rb_hash_aset(hash, ID2SYM(rb_intern("heading_tags_applied")), INT2NUM(result.heading_tags_applied));
  rb_hash_aset(hash, ID2SYM(rb_intern("contrast_fixes_applied")), INT2NUM(result.contrast_fixes_applied));
  rb_hash_aset(hash, ID2SYM(rb_intern("changes")), string_array(result.changes));
  rb_hash_aset(hash, ID2SYM(rb_intern("warnings")), string_array(result.warnings));
  rb_hash_aset(hash, ID2SYM(rb_intern("errors")), string_array(result.errors));
  return hash;
}

// verify_visually:, incremental:, render_dpi:, tier2_backend:
static void read_options(VALUE kwargs, EngineOptions& options) {
  if (NIL_P(kwargs)) return;

  ID keys[4];
  VALUE values[4] = {Qundef, Qundef, Qundef, Qundef};
  keys[0] = rb_intern("verify_visually");
  keys[1] = rb_intern("incremental");
  keys[2] = rb_intern("render_dpi");
  keys[3] = rb_intern("tier2_backend");

  rb_get_kwargs(kwargs, keys, 0, 4, values);

  if (values[0] != Qundef) options.verify_visually = RTEST(values[0]);
  if (values[1] != Qundef) options.incremental = RTEST(values[1]);
  if (values[2] != Qundef) options.render_dpi = NUM2DBL(values[2]);
  if (values[3] != Qundef) {
    VALUE name = SYMBOL_P(values[3]) ? rb_sym2str(values[3]) : values[3];
    Check_Type(name, T_STRING);
    std::string backend(RSTRING_PTR(name), RSTRING_LEN(name));
    std::string error;
    try {
      options.tier2_backend = tier2_backend_from_string(backend);
    } catch (std::exception const& e) {
      error = e.what();
    }
    if (!error.empty()) rb_raise(rb_eArgError, "%s", error.c_str());
  }
}

// ---- Document ---------------------------------------------------------------

VALUE rb_pdf_a11y_show_structure(VALUE self) {
  DocumentHandle* h = get_handle(self);

  std::string result;
  std::string error;
  try {
    result = dump_structure(h->qpdf());
  } catch (QPDFExc const& e) {
    error = std::string("QPDF Error: ") + e.what() + " (filename: " + e.getFilename() + ")";
  } catch (std::exception const& e) {
    error = e.what();
  }
  if (!error.empty()) rb_raise(rb_ePdfA11yError, "%s", error.c_str());

  return rb_utf8_str_new(result.data(), static_cast<long>(result.size()));
}

VALUE rb_pdf_a11y_tagged_p(VALUE self) { return is_tagged(get_handle(self)->qpdf()) ? Qtrue : Qfalse; }

VALUE rb_pdf_a11y_page_count(VALUE self) { return SIZET2NUM(get_handle(self)->pages().size()); }

static void doc_free(void* ptr) { pdf_a11y::pdf_a11y_close(static_cast<pdf_a11y::DocumentHandle*>(ptr)); }

static VALUE doc_alloc(VALUE klass) { return Data_Wrap_Struct(klass, /* mark */ 0, doc_free, nullptr); }

static VALUE doc_initialize(VALUE self, VALUE filename) {
  Check_Type(filename, T_STRING);

  std::string error;
  try {
    DATA_PTR(self) = pdf_a11y::pdf_a11y_open(StringValueCStr(filename));
  } catch (std::exception const& e) {
    error = e.what();
  }
  if (!error.empty()) rb_raise(rb_ePdfA11yError, "%s", error.c_str());

  return self;
}

static VALUE doc_from_memory(VALUE klass, VALUE str) {
  Check_Type(str, T_STRING);

  DocumentHandle* h = nullptr;
  std::string error;
  try {
    h = pdf_a11y::pdf_a11y_open_memory("ruby-memory", reinterpret_cast<unsigned char const*>(RSTRING_PTR(str)),
                                       RSTRING_LEN(str));
  } catch (std::exception const& e) {
    error = e.what();
  }
  if (!error.empty()) rb_raise(rb_ePdfA11yError, "%s", error.c_str());
  if (!h) rb_sys_fail("pdf_a11y_open_memory");

  return Data_Wrap_Struct(klass, 0, doc_free, h);
}

static VALUE doc_write(VALUE self, VALUE out_filename) {
  Check_Type(out_filename, T_STRING);
  DocumentHandle* h = get_handle(self);

  int rc = 0;
  std::string error;
  try {
    rc = pdf_a11y::pdf_a11y_write(h, StringValueCStr(out_filename));
  } catch (std::exception const& e) {
    error = e.what();
  }
  if (!error.empty()) rb_raise(rb_ePdfA11yError, "%s", error.c_str());
  if (rc == -1) rb_sys_fail("pdf_a11y_write");

  return Qnil;
}

static VALUE doc_to_memory(VALUE self) {
  DocumentHandle* h = get_handle(self);

  std::string bytes;
  std::string error;
  try {
    bytes = h->write_to_memory();
  } catch (std::exception const& e) {
    error = e.what();
  }
  if (!error.empty()) rb_raise(rb_ePdfA11yError, "%s", error.c_str());

  return rb_str_new(bytes.data(), static_cast<long>(bytes.size()));
}

static VALUE doc_close(VALUE self) {
  DocumentHandle* h;
  Data_Get_Struct(self, DocumentHandle, h);
  if (h) h->close();
  return Qnil;
}

// ---- module functions -------------------------------------------------------

// PdfA11y.apply_plan(plan_json, **options) -> Hash
VALUE rb_pdf_a11y_apply_plan(int argc, VALUE* argv, VALUE self) {
  VALUE plan_json, kwargs;
  rb_scan_args(argc, argv, "1:", &plan_json, &kwargs);
  Check_Type(plan_json, T_STRING);

  TaggingPlan plan;
  std::string error;
  try {
    plan = parse_tagging_plan(std::string(RSTRING_PTR(plan_json), RSTRING_LEN(plan_json)));
  } catch (std::exception const& e) {
    error = e.what();
  }
  if (!error.empty()) rb_raise(rb_ePdfA11yError, "%s", error.c_str());

  read_options(kwargs, plan.options);
  return result_to_hash(apply_pdf_fixes(plan.input_path, plan.output_path, plan.request, plan.options));
}

struct ColorMapCollector {
  std::vector<ColorFix> fixes;
};

static int collect_color(VALUE key, VALUE value, VALUE arg) {
  auto* collector = reinterpret_cast<ColorMapCollector*>(arg);
  Check_Type(key, T_STRING);
  Check_Type(value, T_STRING);
  collector->fixes.push_back(
      {std::string(RSTRING_PTR(key), RSTRING_LEN(key)), std::string(RSTRING_PTR(value), RSTRING_LEN(value))});
  return ST_CONTINUE;
}

// PdfA11y.apply_contrast_fixes(path, {"#C0C0C0" => "#595959"}, **options) -> Hash
VALUE rb_pdf_a11y_apply_contrast_fixes(int argc, VALUE* argv, VALUE self) {
  VALUE path, color_map, kwargs;
  rb_scan_args(argc, argv, "2:", &path, &color_map, &kwargs);
  Check_Type(path, T_STRING);
  Check_Type(color_map, T_HASH);

  ColorMapCollector collector;
  rb_hash_foreach(color_map, collect_color, reinterpret_cast<VALUE>(&collector));

  EngineOptions options;
  read_options(kwargs, options);
  return result_to_hash(apply_contrast_fixes_to_pdf(StringValueCStr(path), collector.fixes, options));
}

struct AltMapCollector {
  std::vector<AltTextAction> alt_texts;
};

static int collect_alt(VALUE key, VALUE value, VALUE arg) {
  auto* collector = reinterpret_cast<AltMapCollector*>(arg);
  Check_Type(value, T_STRING);

  AltTextAction action;
  action.xref = NUM2INT(key);
  action.image_id = "obj " + std::to_string(*action.xref);
  action.alt_text = std::string(RSTRING_PTR(value), RSTRING_LEN(value));
  collector->alt_texts.push_back(action);
  return ST_CONTINUE;
}

// PdfA11y.update_figure_alt_texts(path, {image_object_id => "alt"}, **options) -> Hash
VALUE rb_pdf_a11y_update_figure_alt_texts(int argc, VALUE* argv, VALUE self) {
  VALUE path, alt_map, kwargs;
  rb_scan_args(argc, argv, "2:", &path, &alt_map, &kwargs);
  Check_Type(path, T_STRING);
  Check_Type(alt_map, T_HASH);

  AltMapCollector collector;
  rb_hash_foreach(alt_map, collect_alt, reinterpret_cast<VALUE>(&collector));

  EngineOptions options;
  read_options(kwargs, options);
  return result_to_hash(update_existing_figure_alt_texts(StringValueCStr(path), collector.alt_texts, options));
}

VALUE rb_pdf_a11y_strip_struct_tree(VALUE self, VALUE source, VALUE output) {
  Check_Type(source, T_STRING);
  Check_Type(output, T_STRING);
  return strip_struct_tree(std::string(StringValueCStr(source)), std::string(StringValueCStr(output))) ? Qtrue
                                                                                                       : Qfalse;
}

RUBY_FUNC_EXPORTED "C" void Init_pdf_a11y(void) {
  rb_mPdfA11y = rb_define_module("PdfA11y");
  rb_cDocument = rb_define_class_under(rb_mPdfA11y, "Document", rb_cObject);
  rb_ePdfA11yError = rb_define_class_under(rb_mPdfA11y, "Error", rb_eStandardError);

  rb_define_alloc_func(rb_cDocument, doc_alloc);

  rb_define_method(rb_cDocument, "initialize", RUBY_METHOD_FUNC(doc_initialize), 1);
  rb_define_singleton_method(rb_cDocument, "from_memory", RUBY_METHOD_FUNC(doc_from_memory), 1);

  rb_define_method(rb_cDocument, "write", RUBY_METHOD_FUNC(doc_write), 1);
  rb_define_method(rb_cDocument, "to_memory", RUBY_METHOD_FUNC(doc_to_memory), 0);
  rb_define_method(rb_cDocument, "close", RUBY_METHOD_FUNC(doc_close), 0);

  rb_define_method(rb_cDocument, "show_structure", RUBY_METHOD_FUNC(rb_pdf_a11y_show_structure), 0);
  rb_define_method(rb_cDocument, "tagged?", RUBY_METHOD_FUNC(rb_pdf_a11y_tagged_p), 0);
  rb_define_method(rb_cDocument, "page_count", RUBY_METHOD_FUNC(rb_pdf_a11y_page_count), 0);

  rb_define_module_function(rb_mPdfA11y, "apply_plan", RUBY_METHOD_FUNC(rb_pdf_a11y_apply_plan), -1);
  rb_define_module_function(rb_mPdfA11y, "apply_contrast_fixes", RUBY_METHOD_FUNC(rb_pdf_a11y_apply_contrast_fixes),
                            -1);
  rb_define_module_function(rb_mPdfA11y, "update_figure_alt_texts",
                            RUBY_METHOD_FUNC(rb_pdf_a11y_update_figure_alt_texts), -1);
  rb_define_module_function(rb_mPdfA11y, "strip_struct_tree", RUBY_METHOD_FUNC(rb_pdf_a11y_strip_struct_tree), 2);
}
