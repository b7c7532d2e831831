/**
 * @file camera.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once
#ifndef _DCL_RGBD_CAMERA_HPP_
#define _DCL_RGBD_CAMERA_HPP_

#include <opencv2/core/mat.hpp>
#include <Eigen/Core>

namespace dcl {
namespace rgbd {

/**
 * Pinhole camera intrinsics at a given pixel resolution. Unlike a raw camera
 * matrix the principal point is stored as a positive pixel coordinate.
 */
struct Camera {
	double fx;				// Focal length X
	double fy;				// Focal length Y
	double cx;				// Principle point X
	double cy;				// Principle point Y
	unsigned int width;		// Pixel width
	unsigned int height;	// Pixel height

	/**
	 * Same field of view at another resolution.
	 */
	Camera scaled(int width, int height) const;

	/**
	 * Convert camera coordinates into screen coordinates.
	 */
	Eigen::Vector2d camToScreen(const Eigen::Vector3d &pos) const;

	/**
	 * Convert screen plus depth into camera coordinates.
	 */
	inline Eigen::Vector3d screenToCam(int ux, int uy, double depth) const {
		return Eigen::Vector3d(
			(double(ux) - cx) * depth / fx,
			(double(uy) - cy) * depth / fy,
			depth);
	}

	/**
	 * Make a camera from a 3x3 intrinsic matrix calibrated at the given size.
	 * Throws if the matrix is not 3x3 or the focal lengths are not positive.
	 */
	static Camera from(const cv::Mat &K, const cv::Size &size);

	cv::Mat getCameraMatrix(const cv::Size& sz={0, 0}) const;
};

/**
 * Rescale an intrinsic matrix calibrated at resolution `original` so that
 * it describes the same field of view at resolution `target`. Focal lengths
 * and principal point are scaled per axis, every other entry is copied. The
 * input is not modified.
 */
cv::Mat scaleCameraMatrix(const cv::Mat &K, const cv::Size &original, const cv::Size &target);

/**
 * Bring a colour image onto the depth pixel grid. When the grids differ the
 * intrinsics are rescaled from the calibration resolution to the depth
 * resolution and the colour image is resampled bilinearly, in place. When
 * they already match the intrinsics are used as given.
 */
Camera matchResolution(const cv::Mat &K, const cv::Size &calibration, cv::Mat &rgb, const cv::Size &depth);

}
}

#endif  // _DCL_RGBD_CAMERA_HPP_
