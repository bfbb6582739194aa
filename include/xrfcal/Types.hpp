#pragma once
#include <Eigen/Dense>
#include <vector>

namespace xrfcal {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;
	using Index  = Eigen::Index;

	// true == channel is masked out
	using ChannelMask = std::vector<bool>;
} // namespace xrfcal
