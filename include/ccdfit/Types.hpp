#pragma once
#include <Eigen/Dense>
#include <cstdint>
#include <vector>
namespace ccdfit {
	using Real          = double;
	using Vector        = Eigen::VectorXd;
	using Matrix        = Eigen::MatrixXd;
	using QualityVector = Eigen::VectorXi;                      // one QA code per observation
	using Mask          = Eigen::Array<bool, Eigen::Dynamic, 1>;
	using Dates         = std::vector<std::int64_t>;            // ordinal days
} // namespace ccdfit
