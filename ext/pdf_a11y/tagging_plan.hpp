#pragma once

#define POINTERHOLDER_TRANSITION 1

#include "engine_options.hpp"
#include "fix_actions.hpp"

#include <string>

namespace pdf_a11y {

/**
 * The JSON contract between the remediation pipeline and a tagger:
 *
 *   { "input_path": ..., "output_path": ...,
 *     "metadata": { "title": ..., "language": ... },
 *     "elements": [ { "type": "heading" | "image_alt" | "table" | "link", ... } ],
 *     "contrast": [ { "original": "#RRGGBB", "fixed": "#RRGGBB" } ],
 *     "options": { ... } }
 *
 * An image_alt element with empty alt_text marks the image decorative. An
 * xref of 0 means the image object is unknown.
 */
struct TaggingPlan {
  std::string input_path;
  std::string output_path;
  FixRequest request;
  EngineOptions options;
};

/** Throws std::runtime_error on malformed JSON or a plan without paths. */
TaggingPlan parse_tagging_plan(std::string const& json);
TaggingPlan read_tagging_plan(std::string const& path);

std::string tagging_plan_json(TaggingPlan const& plan);
void write_tagging_plan(std::string const& path, TaggingPlan const& plan);

/** { success, output_path, tags_applied, heading_tags_applied, contrast_fixes_applied, changes, warnings, errors } */
std::string result_json(PdfWriteResult const& result);

}  // namespace pdf_a11y
