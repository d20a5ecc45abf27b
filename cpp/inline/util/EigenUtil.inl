#include "util/EigenUtil.hpp"

#include "util/Exception.hpp"

#include <algorithm>
#include <format>

namespace eigen_util {

template <typename Array>
int argmax(const Array& arr) {
  int index;
  arr.maxCoeff(&index);
  return index;
}

template <typename Matrix>
void print_matrix(std::ostream& os, const Matrix& matrix, const std::vector<std::string>& row_labels,
                  const std::vector<std::string>& col_labels, const char* value_fmt) {
  if ((int)row_labels.size() != matrix.rows() || (int)col_labels.size() != matrix.cols()) {
    throw util::Exception("print_matrix() - label/shape mismatch ({}x{} labels vs {}x{} matrix)",
                          row_labels.size(), col_labels.size(), matrix.rows(), matrix.cols());
  }

  size_t row_label_width = 0;
  for (const auto& label : row_labels) {
    row_label_width = std::max(row_label_width, label.size());
  }

  os << std::string(row_label_width, ' ');
  for (const auto& label : col_labels) {
    os << std::format(" {:>6}", label);
  }
  os << '\n';

  for (int r = 0; r < matrix.rows(); ++r) {
    os << std::format("{:<{}}", row_labels[r], row_label_width);
    for (int c = 0; c < matrix.cols(); ++c) {
      auto value = matrix(r, c);
      os << ' ' << std::vformat(value_fmt, std::make_format_args(value));
    }
    os << '\n';
  }
}

}  // namespace eigen_util
