#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace stockwise::core {

/**
 * @class DistanceMatrix
 * @brief Symmetric square matrix of pairwise distances between items.
 *
 * Stored as a vector of rows so that DBSCAN neighbourhood scans walk a
 * contiguous row per point.
 */
class DistanceMatrix {
public:
	using Matrix = std::vector<std::vector<double>>;
	using Row = std::vector<double>;

	DistanceMatrix() = default;

	/**
	 * @throws std::invalid_argument if the matrix is not square.
	 */
	explicit DistanceMatrix(Matrix data) : matrix_(std::move(data)) {
		validateSquare();
	}

	static DistanceMatrix fromSquare(Matrix data) {
		return DistanceMatrix(std::move(data));
	}

	/// Euclidean distances between the rows of @p points.
	static DistanceMatrix euclidean(const Eigen::MatrixXd &points);

	std::size_t size() const noexcept {
		return matrix_.size();
	}

	bool empty() const noexcept {
		return matrix_.empty();
	}

	const Row &operator[](std::size_t index) const {
		return matrix_[index];
	}

	const double &at(std::size_t row, std::size_t col) const {
		return matrix_.at(row).at(col);
	}

private:
	void validateSquare() const {
		const auto n = matrix_.size();
		for (const auto &row : matrix_) {
			if (row.size() != n) {
				throw std::invalid_argument("distance matrix must be square");
			}
		}
	}

	Matrix matrix_;
};

} // namespace stockwise::core
