#include "image_locator.hpp"

#include <algorithm>
#include <iterator>
#include <stack>
#include <stdexcept>

namespace pdf_a11y {

using Matrix = std::array<double, 6>;

static std::pair<double, double> apply_matrix(Matrix const& m, double x, double y) {
  double x_new = m[0] * x + m[2] * y + m[4];
  double y_new = m[1] * x + m[3] * y + m[5];
  return {x_new, y_new};
}

// m1 x m2: the effect of "m1 cm" issued while m2 is the CTM
static Matrix multiply(Matrix const& m1, Matrix const& m2) {
  return {m1[0] * m2[0] + m1[1] * m2[2],         m1[0] * m2[1] + m1[1] * m2[3],
          m1[2] * m2[0] + m1[3] * m2[2],         m1[2] * m2[1] + m1[3] * m2[3],
          m1[4] * m2[0] + m1[5] * m2[2] + m2[4], m1[4] * m2[1] + m1[5] * m2[3] + m2[5]};
}

// Images are painted into the unit square of their CTM.
static std::array<double, 4> compute_bbox(Matrix const& matrix) {
  std::array<std::pair<double, double>, 4> corners = {apply_matrix(matrix, 0, 0), apply_matrix(matrix, 1, 0),
                                                      apply_matrix(matrix, 1, 1), apply_matrix(matrix, 0, 1)};

  double min_x = corners[0].first;
  double max_x = corners[0].first;
  double min_y = corners[0].second;
  double max_y = corners[0].second;

  for (int i = 1; i < 4; ++i) {
    min_x = std::min(min_x, corners[i].first);
    max_x = std::max(max_x, corners[i].first);
    min_y = std::min(min_y, corners[i].second);
    max_y = std::max(max_y, corners[i].second);
  }

  return {min_x, min_y, max_x, max_y};
}

static std::optional<ImageLocation> get_image_info(QPDFObjectHandle resources, std::string const& name) {
  if (!resources.isDictionary()) {
    return std::nullopt;
  }

  QPDFObjectHandle xobjects = resources.getKey("/XObject");
  if (!xobjects.isDictionary() || !xobjects.hasKey(name)) {
    return std::nullopt;
  }

  QPDFObjectHandle xobject = xobjects.getKey(name);
  if (!xobject.isStream()) {
    return std::nullopt;
  }

  QPDFObjectHandle dict = xobject.getDict();
  if (!dict.getKey("/Subtype").isNameAndEquals("/Image")) {
    return std::nullopt;
  }

  ImageLocation info;
  info.name = name;
  info.image = xobject.getObjGen();

  if (dict.getKey("/Height").isInteger()) {
    info.height = dict.getKey("/Height").getNumericValue();
  }
  if (dict.getKey("/Width").isInteger()) {
    info.width = dict.getKey("/Width").getNumericValue();
  }
  return info;
}

struct OperatorInfo {
  char const* name;
  char const* description;
  size_t operand_count;
};

static constexpr OperatorInfo OPERATOR_CM = {"cm", "Concatenate matrix (set CTM)", 6};
static constexpr OperatorInfo OPERATOR_Q = {"q", "Save graphics state", 0};
static constexpr OperatorInfo OPERATOR_Q_UPPER = {"Q", "Restore graphics state", 0};
static constexpr OperatorInfo OPERATOR_DO = {"Do", "Invoke named XObject (draw image/form)", 1};
static constexpr OperatorInfo OPERATOR_BDC = {"BDC", "Begin Marked Content sequence with property list", 2};
static constexpr OperatorInfo OPERATOR_BMC = {"BMC", "Begin Marked Content sequence", 1};
static constexpr OperatorInfo OPERATOR_EMC = {"EMC", "End Marked Content sequence", 0};

class CMDoExtractor : public QPDFObjectHandle::ParserCallbacks {
 public:
  CMDoExtractor(QPDFPageObjectHelper& page_ref, int page_index) : page(page_ref), page_index(page_index) {}

  void handleEOF() override {}

  void handleObject(QPDFObjectHandle obj, size_t, size_t) override {
    if (!obj.isOperator()) {
      operand_stack.push_back(obj);
      return;
    }

    std::string op = obj.getOperatorValue();

    if (op == OPERATOR_CM.name && operand_stack.size() >= OPERATOR_CM.operand_count) {
      auto numeric_at = [&](size_t distance_from_top) -> double {
        auto& operand = operand_stack[operand_stack.size() - distance_from_top];
        if (!operand.isNumber()) {
          throw std::runtime_error(std::string("pdf_a11y: numeric cm operand expected (got ") +
                                   operand.getTypeName() + ")");
        }
        return operand.getNumericValue();
      };

      // pull operands (top of stack is distance 1)
      Matrix m = {numeric_at(6), numeric_at(5), numeric_at(4), numeric_at(3), numeric_at(2), numeric_at(1)};
      current_matrix = multiply(m, current_matrix);
    } else if (op == OPERATOR_Q.name) {
      matrix_stack.push(current_matrix);
    } else if (op == OPERATOR_Q_UPPER.name) {
      if (!matrix_stack.empty()) {
        current_matrix = matrix_stack.top();
        matrix_stack.pop();
      }
    } else if (op == OPERATOR_BDC.name && operand_stack.size() >= OPERATOR_BDC.operand_count) {
      mcid_stack.push(current_mcid);
      int mcid = mcid_of(operand_stack.back());
      // nested sequences without their own MCID stay inside the outer one
      if (mcid >= 0) current_mcid = mcid;
    } else if (op == OPERATOR_BMC.name) {
      mcid_stack.push(current_mcid);
    } else if (op == OPERATOR_EMC.name) {
      if (!mcid_stack.empty()) {
        current_mcid = mcid_stack.top();
        mcid_stack.pop();
      } else {
        current_mcid = -1;
      }
    } else if (op == OPERATOR_DO.name && operand_stack.size() >= OPERATOR_DO.operand_count &&
               operand_stack.back().isName()) {
      auto info = get_image_info(page.getAttribute("/Resources", false), operand_stack.back().getName());
      if (info) {
        info->page_index = page_index;
        info->mcid = current_mcid;
        info->cm_matrix = current_matrix;
        info->bbox = compute_bbox(current_matrix);
        clip_to_media_box(info->bbox);
        images.push_back(*info);
      }
    }

    // every operator consumes its operands
    operand_stack.clear();
  }

  std::vector<ImageLocation> const& getImages() const { return images; }

 private:
  int mcid_of(QPDFObjectHandle properties) {
    if (properties.isName()) {
      // Properties is a name, look it up in Resources /Properties dictionary
      QPDFObjectHandle resources = page.getAttribute("/Resources", false);
      if (resources.isDictionary()) {
        properties = resources.getKey("/Properties").getKeyIfDict(properties.getName());
      }
    }
    if (properties.isDictionary() && properties.getKey("/MCID").isInteger()) {
      return properties.getKey("/MCID").getIntValueAsInt();
    }
    return -1;
  }

  void clip_to_media_box(std::array<double, 4>& bb) {
    QPDFObjectHandle mb = page.getMediaBox();
    if (!mb.isRectangle()) return;

    auto r = mb.getArrayAsRectangle();
    bb[0] = std::max(bb[0], std::min(r.llx, r.urx));  // left  edge
    bb[1] = std::max(bb[1], std::min(r.lly, r.ury));  // bottom edge
    bb[2] = std::min(bb[2], std::max(r.llx, r.urx));  // right edge
    bb[3] = std::min(bb[3], std::max(r.lly, r.ury));  // top   edge
  }

  QPDFPageObjectHelper& page;
  int page_index;

  Matrix current_matrix = {1, 0, 0, 1, 0, 0};
  std::stack<Matrix> matrix_stack;
  std::vector<QPDFObjectHandle> operand_stack;

  std::stack<int> mcid_stack;
  int current_mcid = -1;

  std::vector<ImageLocation> images;
};

void ImageLocator::find(QPDF& pdf) {
  auto const& pages = pdf.getAllPages();
  for (size_t i = 0; i < pages.size(); ++i) {
    QPDFPageObjectHelper poh(pages[i]);
    this->find(poh, static_cast<int>(i));
  }
}

void ImageLocator::find(QPDFPageObjectHelper& page, int page_index) {
  CMDoExtractor cb(page, page_index);
  page.parseContents(&cb);

  auto const& found = cb.getImages();
  m_images.insert(m_images.end(), found.begin(), found.end());
}

std::vector<ImageLocation> ImageLocator::on_page(int page_index) const {
  std::vector<ImageLocation> result;
  std::copy_if(m_images.begin(), m_images.end(), std::back_inserter(result),
               [page_index](ImageLocation const& img) { return img.page_index == page_index; });
  return result;
}

std::optional<ImageLocation> ImageLocator::locate(int object_id) const {
  auto it = std::find_if(m_images.begin(), m_images.end(),
                         [object_id](ImageLocation const& img) { return img.image.getObj() == object_id; });
  if (it == m_images.end()) return std::nullopt;
  return *it;
}

}  // namespace pdf_a11y
