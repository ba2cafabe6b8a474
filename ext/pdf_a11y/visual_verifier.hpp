#pragma once

#include "document_handle.hpp"
#include "engine_options.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pdf_a11y {

/** Uncompressed page raster, one 0xAARRGGBB word per pixel, row major. */
struct RasterImage {
  int width = 0;
  int height = 0;
  bool valid = false;
  std::vector<uint32_t> pixels;
};

/**
 * Percentage of pixels (0..100) where any of R, G or B differs by more than
 * threshold. Invalid rasters and size mismatches count as 100, two empty
 * rasters as 0.
 */
double pixel_diff_percent(RasterImage const& a, RasterImage const& b, int threshold = 5);

/** Renders pages of a serialized PDF with poppler. */
class PageRenderer {
 public:
  explicit PageRenderer(double dpi = 72.0) : m_dpi(dpi) {}

  RasterImage render(std::string const& pdf_bytes, int page_index) const;

 private:
  double m_dpi;
};

/**
 * Renders pages of an open document without touching it: the document is
 * serialized to memory and the copy is rendered.
 */
class VisualVerifier {
 public:
  VisualVerifier(DocumentHandle& doc, EngineOptions const& options);

  RasterImage render_page(int page_index);
  double diff_percent(RasterImage const& before, RasterImage const& after) const;

 private:
  DocumentHandle& m_doc;
  PageRenderer m_renderer;
  int m_threshold;
};

}  // namespace pdf_a11y
