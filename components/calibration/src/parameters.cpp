#include "dcl/calibration/parameters.hpp"

#include <opencv2/core.hpp>

#include <cmath>

using cv::Mat;
using cv::Size;

using namespace dcl::calibration;

bool validate::rotationMatrix(const Mat &M) {
	if (M.type() != CV_64F)				{ return false; }
	if (M.channels() != 1) 				{ return false; }
	if (M.size() != Size(3, 3))			{ return false; }

	double det = cv::determinant(M);
	if (std::abs(std::abs(det)-1.0) > 0.00001)	{ return false; }

	return true;
}

bool validate::pose(const Mat &M) {
	if (M.size() != Size(4, 4))			{ return false; }
	if (!validate::rotationMatrix(M(cv::Rect(0, 0, 3, 3))))
										{ return false; }
	// Reflections are not rigid motions
	if (cv::determinant(M(cv::Rect(0, 0, 3, 3))) <= 0.0)
										{ return false; }
	if (!(	(M.at<double>(3, 0) == 0.0) &&
			(M.at<double>(3, 1) == 0.0) &&
			(M.at<double>(3, 2) == 0.0) &&
			(M.at<double>(3, 3) == 1.0))) { return false; }

	return true;
}

bool validate::cameraMatrix(const Mat &M) {
	if (M.type() != CV_64F)				{ return false; }
	if (M.channels() != 1)				{ return false; }
	if (M.size() != Size(3, 3))			{ return false; }

	if (!(	(M.at<double>(2, 0) == 0.0) &&
			(M.at<double>(2, 1) == 0.0) &&
			(M.at<double>(2, 2) == 1.0))) { return false; }

	if (!(M.at<double>(0, 0) > 0.0) || !(M.at<double>(1, 1) > 0.0)) { return false; }

	return true;
}
