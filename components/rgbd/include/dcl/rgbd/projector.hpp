/**
 * @file projector.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once
#ifndef _DCL_RGBD_PROJECTOR_HPP_
#define _DCL_RGBD_PROJECTOR_HPP_

#include <dcl/rgbd/camera.hpp>
#include <dcl/rgbd/point.hpp>

#include <opencv2/core/mat.hpp>
#include <Eigen/Core>

namespace dcl {
namespace rgbd {

/**
 * Coordinate system of generated points. WORLD applies the per frame
 * camera-to-world pose, CAMERA applies one identity for every frame.
 */
enum class CoordinateFrame {
	CAMERA = 0,
	WORLD = 1
};

/**
 * Back-project a depth image into a coloured point cloud.
 *
 * Every pixel is visited in row-major order. Depth is divided by `scale` to
 * give meters and pixels with a depth of zero or less produce no point. The
 * camera space point is transformed by `pose` (camera-to-world, or identity
 * for camera coordinates) and coloured from the BGR pixel at the same
 * location.
 *
 * @param rgb    CV_8UC3 colour image, BGR channel order.
 * @param depth  CV_16UC1 raw depth, same size as rgb.
 * @param scale  Raw depth units per meter, must be positive.
 * @param camera Intrinsics at the depth resolution.
 * @param pose   4x4 homogeneous transform applied to each point.
 *
 * Throws dcl::exception on any precondition failure, before producing output.
 */
PointCloud project(const cv::Mat &rgb, const cv::Mat &depth, double scale,
		const Camera &camera, const Eigen::Matrix4d &pose);

}
}

#endif  // _DCL_RGBD_PROJECTOR_HPP_
