#include "stockwise/core/distance_matrix.hpp"

namespace stockwise::core {

DistanceMatrix DistanceMatrix::euclidean(const Eigen::MatrixXd &points) {
	const auto n = static_cast<std::size_t>(points.rows());
	Matrix data(n, Row(n, 0.0));
	for (std::size_t i = 0; i < n; ++i) {
		for (std::size_t j = i + 1; j < n; ++j) {
			const double distance =
			    (points.row(static_cast<Eigen::Index>(i)) - points.row(static_cast<Eigen::Index>(j))).norm();
			data[i][j] = distance;
			data[j][i] = distance;
		}
	}
	return DistanceMatrix(std::move(data));
}

} // namespace stockwise::core
