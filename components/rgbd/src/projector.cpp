#include <dcl/rgbd/projector.hpp>
#include <dcl/exception.hpp>

#include <opencv2/core.hpp>
#include <Eigen/Geometry>

using dcl::rgbd::Camera;
using dcl::rgbd::PointCloud;

static void checkInputs(const cv::Mat &rgb, const cv::Mat &depth, double scale, const Camera &camera) {
	if (depth.type() != CV_16UC1) {
		throw DCL_Error("Depth image must be 16-bit single channel, got type " << depth.type());
	}
	if (rgb.type() != CV_8UC3) {
		throw DCL_Error("Colour image must be 8-bit three channel, got type " << rgb.type());
	}
	if (rgb.size() != depth.size()) {
		throw DCL_Error("Colour and depth dimension mismatch: "
			<< rgb.cols << "x" << rgb.rows << " vs " << depth.cols << "x" << depth.rows);
	}
	if (!(scale > 0.0)) {
		throw DCL_Error("Depth scale factor must be positive: " << scale);
	}
	if (!(camera.fx > 0.0) || !(camera.fy > 0.0)) {
		throw DCL_Error("Invalid focal length (" << camera.fx << ", " << camera.fy << ")");
	}
}

PointCloud dcl::rgbd::project(const cv::Mat &rgb, const cv::Mat &depth, double scale,
		const Camera &camera, const Eigen::Matrix4d &pose) {
	checkInputs(rgb, depth, scale, camera);

	PointCloud cloud;
	cloud.reserve(cv::countNonZero(depth));

	for (int v=0; v<depth.rows; ++v) {
		const uint16_t *dptr = depth.ptr<uint16_t>(v);
		const cv::Vec3b *cptr = rgb.ptr<cv::Vec3b>(v);

		for (int u=0; u<depth.cols; ++u) {
			const double z = double(dptr[u]) / scale;
			if (z <= 0.0) continue;

			const Eigen::Vector4d p = pose * camera.screenToCam(u, v, z).homogeneous();
			const cv::Vec3b &c = cptr[u];

			cloud.push_back({
				p[0], p[1], p[2],
				c[2], c[1], c[0]
			});
		}
	}

	return cloud;
}
