#define POINTERHOLDER_TRANSITION 1

#include "document_handle.hpp"
#include "pdf_write_session.hpp"
#include "struct_walker.hpp"
#include "tagging_plan.hpp"

#include <qpdf/Pl_Discard.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QUtil.hh>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>

static char const* version = "0.1.0";
static char const* whoami = nullptr;

static void usage() {
  std::cerr << "Usage: " << whoami << " [--no-verify] [--full-rewrite] [--quiet] plan.json\n"
            << "Applies a tagging plan and prints the result as JSON on stdout\n"
            << "Other modes:\n"
            << "  " << whoami << " --strip in.pdf out.pdf    copy without structure tree\n"
            << "  " << whoami << " --dump file.pdf           print the structure tree\n"
            << "  " << whoami << " --check-plan plan.json    print the plan as it was read\n";
  exit(2);
}

static int dump(char const* filename, std::shared_ptr<QPDFLogger> const& logger) {
  try {
    auto doc = pdf_a11y::DocumentHandle::open(filename, logger);
    std::cout << pdf_a11y::dump_structure(doc->qpdf());
  } catch (std::exception& e) {
    std::cerr << whoami << ": " << e.what() << std::endl;
    return 2;
  }
  return 0;
}

int main(int argc, char* argv[]) {
  whoami = QUtil::getWhoami(argv[0]);

  // stdout carries the result document, everything else goes to stderr
  auto logger = QPDFLogger::create();
  logger->setOutputStreams(&std::cerr, &std::cerr);

  if ((argc == 2) && (!strcmp(argv[1], "--version"))) {
    std::cout << whoami << " version " << version << std::endl;
    return 0;
  }
  if ((argc == 3) && (!strcmp(argv[1], "--dump"))) {
    return dump(argv[2], logger);
  }
  if ((argc == 4) && (!strcmp(argv[1], "--strip"))) {
    pdf_a11y::EngineOptions options;
    options.logger = logger;
    return pdf_a11y::strip_struct_tree(argv[2], argv[3], options) ? 0 : 1;
  }

  bool no_verify = false;
  bool full_rewrite = false;
  bool quiet = false;
  bool check_only = false;
  char const* plan_file = nullptr;

  for (int i = 1; i < argc; ++i) {
    if (!strcmp(argv[i], "--no-verify")) {
      no_verify = true;
    } else if (!strcmp(argv[i], "--full-rewrite")) {
      full_rewrite = true;
    } else if (!strcmp(argv[i], "--quiet")) {
      quiet = true;
    } else if (!strcmp(argv[i], "--check-plan")) {
      check_only = true;
    } else if (argv[i][0] == '-' || plan_file) {
      usage();
    } else {
      plan_file = argv[i];
    }
  }
  if (!plan_file) usage();

  pdf_a11y::TaggingPlan plan;
  try {
    plan = pdf_a11y::read_tagging_plan(plan_file);
  } catch (std::exception& e) {
    pdf_a11y::PdfWriteResult failed;
    failed.errors.push_back(e.what());
    std::cout << pdf_a11y::result_json(failed) << std::endl;
    return 1;
  }

  if (no_verify) plan.options.verify_visually = false;
  if (full_rewrite) plan.options.incremental = false;
  if (quiet) logger->setInfo(std::make_shared<Pl_Discard>());
  plan.options.logger = logger;

  if (check_only) {
    std::cout << pdf_a11y::tagging_plan_json(plan) << std::endl;
    return 0;
  }

  pdf_a11y::PdfWriteResult result =
      pdf_a11y::apply_pdf_fixes(plan.input_path, plan.output_path, plan.request, plan.options);
  std::cout << pdf_a11y::result_json(result) << std::endl;
  return result.success ? 0 : 1;
}
