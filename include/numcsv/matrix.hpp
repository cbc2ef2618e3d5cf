#pragma once

#include <cstddef>
#include <eigen3/Eigen/Core>
#include <vector>

namespace numcsv
{

using Record = std::vector<double>;

// Row-major so that one input line maps to one contiguous row.
using Matrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Copy `records` into a records.size() x cols matrix.
// Throws std::invalid_argument if any record does not have exactly `cols` values.
Matrix assemble_matrix(const std::vector<Record>& records, std::size_t cols);

}   // namespace numcsv
