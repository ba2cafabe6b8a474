#pragma once

#include "engine_options.hpp"
#include "fix_actions.hpp"

#include <string>
#include <vector>

namespace pdf_a11y {

/**
 * Copies source to output and applies request to the copy.
 *
 * Structure and metadata fixes are always applied. Heading tags and color
 * substitutions edit page content and are only kept when rendering shows no
 * visible change; with Tier2Backend::External they are skipped with a
 * warning. The document is saved once and closed once whatever happens.
 *
 * Errors never escape: they end up in the result's errors with success false.
 */
PdfWriteResult apply_pdf_fixes(std::string const& source, std::string const& output, FixRequest const& request,
                               EngineOptions const& options = EngineOptions());

/** In-place color substitution over every page of path. */
PdfWriteResult apply_contrast_fixes_to_pdf(std::string const& path, std::vector<ColorFix> const& fixes,
                                           EngineOptions const& options = EngineOptions());

/** In-place /Alt update of figures that have no usable description yet. */
PdfWriteResult update_existing_figure_alt_texts(std::string const& path, std::vector<AltTextAction> const& alt_texts,
                                                EngineOptions const& options = EngineOptions());

/**
 * Writes a copy of source without StructTreeRoot and MarkInfo. Returns true
 * when the copy was written, whether or not there was a tree to drop.
 */
bool strip_struct_tree(std::string const& source, std::string const& output,
                       EngineOptions const& options = EngineOptions());

}  // namespace pdf_a11y
