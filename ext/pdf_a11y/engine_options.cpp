#include "engine_options.hpp"

#include <stdexcept>

namespace pdf_a11y {

static char const* const PREFIX = "pdf_a11y: ";

Log::Log(std::shared_ptr<QPDFLogger> logger) : m_logger(logger ? std::move(logger) : QPDFLogger::defaultLogger()) {}

void Log::info(std::string const& msg) const { m_logger->info(PREFIX + msg + "\n"); }

void Log::warn(std::string const& msg) const { m_logger->warn(PREFIX + msg + "\n"); }

void Log::error(std::string const& msg) const { m_logger->error(PREFIX + msg + "\n"); }

Tier2Backend tier2_backend_from_string(std::string const& name) {
  if (name == "in_process" || name == "inprocess") return Tier2Backend::InProcess;
  if (name == "external") return Tier2Backend::External;
  throw std::runtime_error("pdf_a11y: unknown tier2 backend \"" + name + "\" (expected in_process or external)");
}

char const* tier2_backend_name(Tier2Backend backend) {
  switch (backend) {
    case Tier2Backend::InProcess:
      return "in_process";
    case Tier2Backend::External:
      return "external";
  }
  return nullptr;
}

}  // namespace pdf_a11y
