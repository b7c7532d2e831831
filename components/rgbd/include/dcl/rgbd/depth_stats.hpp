#pragma once
#ifndef _DCL_RGBD_DEPTH_STATS_HPP_
#define _DCL_RGBD_DEPTH_STATS_HPP_

#include <opencv2/core/mat.hpp>
#include <ostream>

namespace dcl {
namespace rgbd {

/**
 * Summary of a raw depth image. The "valid" fields only consider strictly
 * positive pixels and are zero if there are none.
 */
struct DepthStats {
	int type;
	cv::Size size;
	double min;
	double max;
	double mean;
	double stddev;

	int valid;
	double validMin;
	double validMax;
	double validMean;
};

/**
 * Compute statistics over a single channel depth image of any depth.
 */
DepthStats computeDepthStats(const cv::Mat &depth);

std::ostream &operator<<(std::ostream &os, const DepthStats &stats);

}
}

#endif  // _DCL_RGBD_DEPTH_STATS_HPP_
