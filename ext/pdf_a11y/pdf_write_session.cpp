#include "pdf_write_session.hpp"
#include "document_handle.hpp"
#include "fixers.hpp"
#include "struct_tree.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace pdf_a11y {

namespace {

enum class SessionStatus { Saved, OpenFailed, Failed };

void fail(PdfWriteResult& result, Log const& log, std::string const& msg) {
  result.errors.push_back(msg);
  result.success = false;
  log.error(msg);
}

void save(FixContext& ctx) {
  std::string blocker = ctx.doc.incremental_blocker();
  if (ctx.options.incremental && ctx.doc.has_changes() && !blocker.empty()) {
    ctx.warning("Incremental save not possible (" + blocker + "), rewrote the whole file");
  }

  switch (ctx.doc.save(ctx.options.incremental)) {
    case SaveMode::Unchanged:
      ctx.log.info("nothing to save in " + ctx.doc.filename());
      break;
    case SaveMode::Incremental:
      ctx.log.info("appended incremental update to " + ctx.doc.filename());
      break;
    case SaveMode::FullRewrite:
      ctx.log.info("rewrote " + ctx.doc.filename());
      break;
  }
}

/**
 * open -> apply -> save -> close on the file at path. An exception from
 * apply is fatal: nothing is saved and the file keeps its previous content.
 */
SessionStatus run_session(std::string const& path, EngineOptions const& options, PdfWriteResult& result,
                          std::function<void(FixContext&)> const& apply) {
  Log log(options.logger);

  std::unique_ptr<DocumentHandle> doc;
  try {
    doc = DocumentHandle::open(path, options.logger);
  } catch (std::exception& e) {
    fail(result, log, std::string("Failed to open PDF: ") + e.what());
    return SessionStatus::OpenFailed;
  }

  FixContext ctx(*doc, options, result);
  SessionStatus status = SessionStatus::Saved;
  try {
    apply(ctx);
    save(ctx);
  } catch (std::exception& e) {
    fail(result, log, std::string("Fatal error: ") + e.what());
    status = SessionStatus::Failed;
  }
  doc->close();

  log.info(std::to_string(result.changes.size()) + " changes, " + std::to_string(result.warnings.size()) +
           " warnings for " + path);
  return status;
}

bool same_file(std::string const& a, std::string const& b) {
  std::error_code ec;
  return fs::exists(b, ec) && fs::equivalent(a, b, ec);
}

void apply_tier2(FixContext& ctx, FixRequest const& request) {
  if (ctx.options.tier2_backend == Tier2Backend::External) {
    if (!request.headings.empty()) {
      ctx.warning("Tier 2 heading tags (" + std::to_string(request.headings.size()) +
                  " actions) skipped: deferred to the external tagger");
    }
    if (!request.contrast.empty()) {
      ctx.warning("Tier 2 contrast fixes (" + std::to_string(request.contrast.size()) +
                  " colors) skipped: deferred to the external tagger");
    }
    return;
  }

  apply_headings(ctx, request.headings);
  apply_contrast(ctx, request.contrast);
}

}  // namespace

PdfWriteResult apply_pdf_fixes(std::string const& source, std::string const& output, FixRequest const& request,
                               EngineOptions const& options) {
  PdfWriteResult result;
  result.output_path = output;
  Log log(options.logger);

  if (!fs::is_regular_file(source)) {
    fail(result, log, "Source file not found: " + source);
    return result;
  }

  if (!same_file(source, output)) {
    try {
      fs::copy_file(source, output, fs::copy_options::overwrite_existing);
    } catch (fs::filesystem_error& e) {
      fail(result, log, "Failed to copy " + source + " to " + output + ": " + e.what());
      return result;
    }
  }

  SessionStatus status = run_session(output, options, result, [&request](FixContext& ctx) {
    apply_metadata(ctx, request.metadata);
    apply_alt_texts(ctx, request.alt_texts, request.decorative);
    apply_tables(ctx, request.tables);
    apply_links(ctx, request.links);
    apply_tier2(ctx, request);
  });

  if (status == SessionStatus::OpenFailed && !same_file(source, output)) {
    std::error_code ec;
    fs::remove(output, ec);
  }
  result.success = status == SessionStatus::Saved;
  return result;
}

PdfWriteResult apply_contrast_fixes_to_pdf(std::string const& path, std::vector<ColorFix> const& fixes,
                                           EngineOptions const& options) {
  PdfWriteResult result;
  result.output_path = path;

  if (!fs::is_regular_file(path)) {
    fail(result, Log(options.logger), "PDF not found: " + path);
    return result;
  }
  if (fixes.empty()) {
    result.success = true;
    return result;
  }

  SessionStatus status =
      run_session(path, options, result, [&fixes](FixContext& ctx) { apply_contrast(ctx, fixes); });
  result.success = status == SessionStatus::Saved;
  return result;
}

PdfWriteResult update_existing_figure_alt_texts(std::string const& path, std::vector<AltTextAction> const& alt_texts,
                                                EngineOptions const& options) {
  PdfWriteResult result;
  result.output_path = path;

  if (!fs::is_regular_file(path)) {
    fail(result, Log(options.logger), "PDF not found: " + path);
    return result;
  }
  if (alt_texts.empty()) {
    result.success = true;
    return result;
  }

  SessionStatus status =
      run_session(path, options, result, [&alt_texts](FixContext& ctx) { update_figure_alt_texts(ctx, alt_texts); });
  result.success = status == SessionStatus::Saved;
  return result;
}

bool strip_struct_tree(std::string const& source, std::string const& output, EngineOptions const& options) {
  Log log(options.logger);
  try {
    std::unique_ptr<DocumentHandle> doc = DocumentHandle::open(source, options.logger);
    if (strip_struct_tree(*doc)) log.info("stripped existing StructTreeRoot from " + source);

    if (same_file(source, output)) {
      doc->save(false);
    } else {
      doc->write(output);
    }
    doc->close();
    return true;
  } catch (std::exception& e) {
    log.warn("failed to strip structure tree from " + source + ": " + e.what());
    return false;
  }
}

}  // namespace pdf_a11y
