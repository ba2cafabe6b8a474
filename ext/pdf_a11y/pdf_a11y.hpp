#ifndef PDF_A11Y_H
#define PDF_A11Y_H 1

#include "ruby.h"

VALUE rb_pdf_a11y_show_structure(VALUE self);
VALUE rb_pdf_a11y_tagged_p(VALUE self);
VALUE rb_pdf_a11y_page_count(VALUE self);

VALUE rb_pdf_a11y_apply_plan(int argc, VALUE* argv, VALUE self);
VALUE rb_pdf_a11y_apply_contrast_fixes(int argc, VALUE* argv, VALUE self);
VALUE rb_pdf_a11y_update_figure_alt_texts(int argc, VALUE* argv, VALUE self);
VALUE rb_pdf_a11y_strip_struct_tree(VALUE self, VALUE source, VALUE output);

#endif /* PDF_A11Y_H */
