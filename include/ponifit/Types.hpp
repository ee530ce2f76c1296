#pragma once
#include <Eigen/Dense>
namespace ponifit {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;
} // namespace ponifit
