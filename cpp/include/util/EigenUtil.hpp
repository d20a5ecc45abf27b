#pragma once

#include <Eigen/Core>

#include <ostream>
#include <string>
#include <vector>

/*
 * Various util functions that make the eigen3 library more pleasant to use.
 */
namespace eigen_util {

// DMatrix<R, C> is a fixed-size double Eigen::Matrix, row-major so that rows are contiguous
template <int R, int C>
using DMatrix = Eigen::Matrix<double, R, C, Eigen::RowMajor>;

// Index of the largest coefficient of a 1D array. Eigen's visitor keeps the first maximum it
// finds, so ties go to the lowest index.
template <typename Array>
int argmax(const Array& arr);

/*
 * Prints matrix as a table, with the given row and column labels, and with each value formatted
 * with the given std::format() pattern (e.g. "{:6.3f}").
 *
 * Both label vectors must match the matrix dimensions, otherwise util::Exception is thrown.
 */
template <typename Matrix>
void print_matrix(std::ostream& os, const Matrix& matrix, const std::vector<std::string>& row_labels,
                  const std::vector<std::string>& col_labels, const char* value_fmt = "{:6.3f}");

}  // namespace eigen_util

#include "inline/util/EigenUtil.inl"
