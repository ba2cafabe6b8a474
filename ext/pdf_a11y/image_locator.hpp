// image_locator.hpp
#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <array>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace pdf_a11y {

struct ImageLocation {
  int page_index;
  std::string name;  // XObject resource name, e.g. "/Im0"
  QPDFObjGen image;  // the image XObject
  int mcid;          // innermost enclosing marked-content id, -1 when none
  double width;
  double height;
  std::array<double, 6> cm_matrix;            // CTM in effect at the Do operator
  std::array<double, 4> bbox = {0, 0, 0, 0};  // user-space bounding box [llx, lly, urx, ury]

  ImageLocation() : page_index(-1), mcid(-1), width(0), height(0), cm_matrix{1, 0, 0, 1, 0, 0} {}

  std::string to_string() const {
    std::ostringstream oss;
    oss << "ImageLocation(page=" << page_index << ", name=" << name << ", obj=" << image.getObj()
        << ", mcid=" << mcid << ", bbox=[";
    for (size_t i = 0; i < bbox.size(); ++i) {
      oss << bbox[i];
      if (i != bbox.size() - 1) oss << ", ";
    }
    oss << "])";
    return oss.str();
  }
};

/**
 * Walks page content with qpdf's content parser and records every image
 * XObject that is painted: on which page, under which resource name, inside
 * which marked-content sequence and where on the page.
 *
 * Form XObjects are not descended into.
 */
class ImageLocator {
 public:
  void find(QPDF& pdf);
  void find(QPDFPageObjectHelper& page, int page_index);

  std::vector<ImageLocation> const& images() const { return m_images; }

  std::vector<ImageLocation> on_page(int page_index) const;

  /** First placement of the image object with the given id. */
  std::optional<ImageLocation> locate(int object_id) const;

 private:
  std::vector<ImageLocation> m_images;
};

}  // namespace pdf_a11y
