#ifndef _DCL_DEPTH2CLOUD_DATASET_HPP_
#define _DCL_DEPTH2CLOUD_DATASET_HPP_

#include <dcl/configurable.hpp>
#include <dcl/rgbd/projector.hpp>
#include <dcl/rgbd/point.hpp>

#include <opencv2/core/mat.hpp>
#include <Eigen/Core>

#include <string>
#include <vector>

namespace dcl {

/** Outcome of converting one frame. */
struct FrameResult {
	std::string name;
	size_t points;
	bool ok;
	std::string error;
};

/**
 * A folder of aligned colour and depth images plus intrinsics and optional
 * poses. Each frame pair is converted to a coloured point cloud and written
 * to the output folder as "<stem>.ply".
 *
 * Properties:
 *   path                 Dataset folder
 *   images, depth        Colour and depth sub-folders
 *   output               Point cloud sub-folder, created when missing
 *   intrinsics, poses    Matrix file names
 *   extension            Image file extension to list
 *   scale_factor         Raw depth units per meter
 *   world_frame          Use poses (true) or camera coordinates (false)
 *   calibration_width,
 *   calibration_height   Resolution K was calibrated at, 0 for the first
 *                        colour image's size
 */
class Dataset : public dcl::Configurable {
	public:
	explicit Dataset(nlohmann::json &config);
	~Dataset();

	/**
	 * List frames and read calibration. Throws if the folders do not pair up
	 * or the matrix files are malformed.
	 */
	void load();

	size_t size() const { return colour_.size(); }

	dcl::rgbd::CoordinateFrame frame() const { return frame_; }

	/**
	 * Decode and back-project one frame. Throws on any failure.
	 */
	dcl::rgbd::PointCloud reconstruct(size_t ix);

	/**
	 * Reconstruct and save one frame. Errors are logged and returned in the
	 * result rather than thrown.
	 */
	FrameResult process(size_t ix);

	/**
	 * Process all frames on the thread pool. Results are in frame order.
	 */
	std::vector<FrameResult> processAll();

	private:
	std::string path_;
	std::string output_;
	std::vector<std::string> colour_;
	std::vector<std::string> depth_;
	cv::Mat K_;
	cv::Size calibration_;
	std::vector<Eigen::Matrix4d> poses_;
	double scale_;
	dcl::rgbd::CoordinateFrame frame_;
	bool loaded_;

	std::string _path(const std::string &name);
	std::vector<std::string> _list(const std::string &dir);
	const Eigen::Matrix4d &_pose(size_t ix) const;
};

}

#endif  // _DCL_DEPTH2CLOUD_DATASET_HPP_
