#include <dcl/rgbd/camera.hpp>
#include <dcl/exception.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>

using dcl::rgbd::Camera;

Camera Camera::from(const cv::Mat &K, const cv::Size &size) {
	if (K.rows != 3 || K.cols != 3 || K.channels() != 1) {
		throw DCL_Error("Camera matrix must be 3x3, got " << K.rows << "x" << K.cols);
	}

	cv::Mat K64;
	K.convertTo(K64, CV_64F);

	Camera r;
	r.fx = K64.at<double>(0,0);
	r.fy = K64.at<double>(1,1);
	r.cx = K64.at<double>(0,2);
	r.cy = K64.at<double>(1,2);
	r.width = size.width;
	r.height = size.height;

	if (!(r.fx > 0.0) || !(r.fy > 0.0)) {
		throw DCL_Error("Invalid focal length (" << r.fx << ", " << r.fy << ")");
	}
	return r;
}

cv::Mat Camera::getCameraMatrix(const cv::Size& sz) const {
	if (sz == cv::Size{0, 0}) {
		cv::Mat K = cv::Mat::eye(cv::Size(3, 3), CV_64FC1);
		K.at<double>(0,0) = fx;
		K.at<double>(0,2) = cx;
		K.at<double>(1,1) = fy;
		K.at<double>(1,2) = cy;
		return K;
	}
	else {
		return scaled(sz.width, sz.height).getCameraMatrix();
	}
}

/*
 * Scale camera parameters to match resolution.
 */
Camera Camera::scaled(int width, int height) const {
	const auto &cam = *this;
	double scaleX = double(width) / double(cam.width);
	double scaleY = double(height) / double(cam.height);

	Camera newcam = cam;
	newcam.width = width;
	newcam.height = height;
	newcam.fx *= scaleX;
	newcam.fy *= scaleY;
	newcam.cx *= scaleX;
	newcam.cy *= scaleY;

	return newcam;
}

Eigen::Vector2d Camera::camToScreen(const Eigen::Vector3d &pos) const {
	return Eigen::Vector2d(
		pos.x() * fx / pos.z() + cx,
		pos.y() * fy / pos.z() + cy);
}

cv::Mat dcl::rgbd::scaleCameraMatrix(const cv::Mat &K, const cv::Size &original, const cv::Size &target) {
	if (K.rows != 3 || K.cols != 3 || K.channels() != 1) {
		throw DCL_Error("Camera matrix must be 3x3, got " << K.rows << "x" << K.cols);
	}

	const double scale_x = double(target.width) / double(original.width);
	const double scale_y = double(target.height) / double(original.height);

	cv::Mat adjusted;
	K.convertTo(adjusted, CV_64F);
	adjusted.at<double>(0,0) *= scale_x;
	adjusted.at<double>(1,1) *= scale_y;
	adjusted.at<double>(0,2) *= scale_x;
	adjusted.at<double>(1,2) *= scale_y;
	return adjusted;
}

Camera dcl::rgbd::matchResolution(const cv::Mat &K, const cv::Size &calibration, cv::Mat &rgb, const cv::Size &depth) {
	if (rgb.size() == depth) {
		return Camera::from(K, depth);
	}

	DLOG(1) << "Adjusting intrinsics " << calibration << " -> " << depth;
	Camera cam = Camera::from(scaleCameraMatrix(K, calibration, depth), depth);

	cv::Mat resized;
	cv::resize(rgb, resized, depth, 0.0, 0.0, cv::INTER_LINEAR);
	rgb = resized;
	return cam;
}
