#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <string>

namespace pdf_a11y {

enum class Tier2Backend {
  InProcess,  // headings and contrast are applied by this engine
  External    // deferred to an external tagger, recorded as warnings
};

struct EngineOptions {
  bool verify_visually = true;
  double render_dpi = 72.0;
  int pixel_threshold = 5;
  double heading_tolerance_percent = 0.5;
  double contrast_tolerance_percent = 15.0;
  double color_tolerance = 0.02;
  int max_heading_attempts = 5;
  double bbox_tolerance = 5.0;
  Tier2Backend tier2_backend = Tier2Backend::InProcess;
  bool incremental = true;

  // nullptr means QPDFLogger::defaultLogger()
  std::shared_ptr<QPDFLogger> logger;
};

/**
 * Prefixing front end for the logger configured in EngineOptions.
 */
class Log {
 public:
  explicit Log(std::shared_ptr<QPDFLogger> logger = nullptr);

  void info(std::string const& msg) const;
  void warn(std::string const& msg) const;
  void error(std::string const& msg) const;

  std::shared_ptr<QPDFLogger> const& logger() const { return m_logger; }

 private:
  std::shared_ptr<QPDFLogger> m_logger;
};

Tier2Backend tier2_backend_from_string(std::string const& name);
char const* tier2_backend_name(Tier2Backend backend);

}  // namespace pdf_a11y
