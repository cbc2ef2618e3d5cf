#include <numcsv/matrix.hpp>
#include <stdexcept>
#include <string>

namespace numcsv
{

Matrix assemble_matrix(const std::vector<Record>& records, std::size_t cols)
{
    Matrix m(static_cast<Eigen::Index>(records.size()), static_cast<Eigen::Index>(cols));
    for (std::size_t r = 0; r < records.size(); ++r)
    {
        const Record& rec = records[r];
        if (rec.size() != cols)
            throw std::invalid_argument("assemble_matrix: row " + std::to_string(r) + " has "
                                        + std::to_string(rec.size()) + " values, expected "
                                        + std::to_string(cols));
        m.row(static_cast<Eigen::Index>(r)) =
            Eigen::Map<const Eigen::RowVectorXd>(rec.data(), static_cast<Eigen::Index>(cols));
    }
    return m;
}

}   // namespace numcsv
