#include "visual_verifier.hpp"

#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace pdf_a11y {

double pixel_diff_percent(RasterImage const& a, RasterImage const& b, int threshold) {
  if (!a.valid || !b.valid) return 100.0;
  if (a.width != b.width || a.height != b.height) return 100.0;
  if (a.pixels.empty()) return 0.0;
  if (a.pixels.size() != b.pixels.size()) return 100.0;

  size_t differing = 0;
  for (size_t i = 0; i < a.pixels.size(); ++i) {
    uint32_t pa = a.pixels[i];
    uint32_t pb = b.pixels[i];
    for (int shift : {16, 8, 0}) {
      int ca = static_cast<int>((pa >> shift) & 0xff);
      int cb = static_cast<int>((pb >> shift) & 0xff);
      if (std::abs(ca - cb) > threshold) {
        ++differing;
        break;
      }
    }
  }
  return static_cast<double>(differing) / static_cast<double>(a.pixels.size()) * 100.0;
}

RasterImage PageRenderer::render(std::string const& pdf_bytes, int page_index) const {
  // poppler does not copy raw data, pdf_bytes must outlive doc
  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_raw_data(pdf_bytes.data(), static_cast<int>(pdf_bytes.size())));
  if (!doc) throw std::runtime_error("pdf_a11y: poppler could not load the document");
  if (doc->is_locked()) throw std::runtime_error("pdf_a11y: poppler could not unlock the document");
  if (page_index < 0 || page_index >= doc->pages()) {
    throw std::runtime_error("pdf_a11y: cannot render page " + std::to_string(page_index));
  }

  std::unique_ptr<poppler::page> page(doc->create_page(page_index));
  if (!page) throw std::runtime_error("pdf_a11y: poppler could not create page " + std::to_string(page_index));

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  poppler::image image = renderer.render_page(page.get(), m_dpi, m_dpi);

  RasterImage raster;
  if (!image.is_valid()) return raster;

  raster.width = image.width();
  raster.height = image.height();
  raster.valid = true;
  raster.pixels.resize(static_cast<size_t>(raster.width) * static_cast<size_t>(raster.height));

  char const* data = image.const_data();
  for (int y = 0; y < raster.height; ++y) {
    // argb32 rows hold native-endian 32-bit words
    std::memcpy(&raster.pixels[static_cast<size_t>(y) * static_cast<size_t>(raster.width)],
                data + static_cast<size_t>(y) * static_cast<size_t>(image.bytes_per_row()),
                static_cast<size_t>(raster.width) * sizeof(uint32_t));
  }
  return raster;
}

VisualVerifier::VisualVerifier(DocumentHandle& doc, EngineOptions const& options)
    : m_doc(doc), m_renderer(options.render_dpi), m_threshold(options.pixel_threshold) {}

RasterImage VisualVerifier::render_page(int page_index) {
  std::string bytes = m_doc.write_to_memory();
  return m_renderer.render(bytes, page_index);
}

double VisualVerifier::diff_percent(RasterImage const& before, RasterImage const& after) const {
  return pixel_diff_percent(before, after, m_threshold);
}

}  // namespace pdf_a11y
