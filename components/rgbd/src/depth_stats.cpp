#include <dcl/rgbd/depth_stats.hpp>
#include <dcl/exception.hpp>

#include <opencv2/core.hpp>

using dcl::rgbd::DepthStats;

DepthStats dcl::rgbd::computeDepthStats(const cv::Mat &depth) {
	if (depth.empty()) throw DCL_Error("Empty depth image");
	if (depth.channels() != 1) {
		throw DCL_Error("Depth image must have one channel, got " << depth.channels());
	}

	DepthStats s = {};
	s.type = depth.type();
	s.size = depth.size();

	cv::minMaxLoc(depth, &s.min, &s.max);

	cv::Scalar mean, stddev;
	cv::meanStdDev(depth, mean, stddev);
	s.mean = mean[0];
	s.stddev = stddev[0];

	cv::Mat valid = depth > 0;
	s.valid = cv::countNonZero(valid);
	if (s.valid > 0) {
		cv::minMaxLoc(depth, &s.validMin, &s.validMax, nullptr, nullptr, valid);
		s.validMean = cv::mean(depth, valid)[0];
	}

	return s;
}

std::ostream &dcl::rgbd::operator<<(std::ostream &os, const DepthStats &s) {
	os << "type=" << cv::typeToString(s.type)
		<< " size=" << s.size.width << "x" << s.size.height
		<< " min=" << s.min << " max=" << s.max
		<< " mean=" << s.mean << " stddev=" << s.stddev
		<< " valid=" << s.valid;
	if (s.valid > 0) {
		os << " (min=" << s.validMin << " max=" << s.validMax << " mean=" << s.validMean << ")";
	}
	return os;
}
