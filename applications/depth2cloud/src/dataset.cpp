#include "dataset.hpp"

#include <dcl/configuration.hpp>
#include <dcl/threads.hpp>
#include <dcl/calibration/matrix_io.hpp>
#include <dcl/calibration/parameters.hpp>
#include <dcl/streams/ply.hpp>

#include <opencv2/core.hpp>
#include <opencv2/core/eigen.hpp>
#include <opencv2/imgcodecs.hpp>
#include <nlohmann/json.hpp>

#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>

#include <future>

using dcl::Dataset;
using dcl::FrameResult;
using dcl::rgbd::CoordinateFrame;
using dcl::rgbd::PointCloud;
using std::string;
using std::vector;

Dataset::Dataset(nlohmann::json &config) : dcl::Configurable(config),
		scale_(1000.0), frame_(CoordinateFrame::WORLD), loaded_(false) {
}

Dataset::~Dataset() {
}

string Dataset::_path(const string &name) {
	if (name.size() > 0 && name[0] == '/') return name;
	return path_ + "/" + name;
}

vector<string> Dataset::_list(const string &dir) {
	if (!dcl::is_directory(dir)) {
		throw DCL_Error("Missing image folder: " << dir);
	}

	const string ext = value("extension", string(".png"));

	vector<string> files;
	for (const auto &f : dcl::directory_listing(dir)) {
		if (f.size() >= ext.size() && f.compare(f.size()-ext.size(), ext.size(), ext) == 0 && dcl::is_file(f)) {
			files.push_back(f);
		}
	}
	return files;
}

void Dataset::load() {
	path_ = value("path", string("."));
	while (path_.size() > 1 && path_.back() == '/') path_.pop_back();

	scale_ = value("scale_factor", 1000.0);
	if (!(scale_ > 0.0)) {
		throw DCL_Error("scale_factor must be positive: " << scale_);
	}

	frame_ = (value("world_frame", true)) ? CoordinateFrame::WORLD : CoordinateFrame::CAMERA;
	output_ = _path(value("output", string("point_clouds")));

	colour_ = _list(_path(value("images", string("images"))));
	depth_ = _list(_path(value("depth", string("depth_maps"))));

	if (colour_.size() == 0) {
		throw DCL_Error("No images found in " << _path(value("images", string("images"))));
	}
	if (colour_.size() != depth_.size()) {
		throw DCL_Error("Image count mismatch: " << colour_.size() << " colour vs " << depth_.size() << " depth");
	}

	K_ = dcl::calibration::loadCameraMatrix(_path(value("intrinsics", string("K.txt"))));
	if (!dcl::calibration::validate::cameraMatrix(K_)) {
		throw DCL_Error("Invalid camera matrix: " << K_);
	}

	poses_.clear();
	if (frame_ == CoordinateFrame::WORLD) {
		poses_ = dcl::calibration::loadPoses(_path(value("poses", string("poses.txt"))));
		if (poses_.size() < colour_.size()) {
			throw DCL_Error("Only " << poses_.size() << " poses for " << colour_.size() << " frames");
		}
		if (poses_.size() > colour_.size()) {
			LOG(WARNING) << "Ignoring " << (poses_.size() - colour_.size()) << " extra poses";
		}

		for (size_t i=0; i<colour_.size(); ++i) {
			cv::Mat M;
			cv::eigen2cv(poses_[i], M);
			if (!dcl::calibration::validate::pose(M)) {
				LOG(WARNING) << "Pose " << i << " is not a rigid transform";
			}
		}
	}

	int cw = value("calibration_width", 0);
	int ch = value("calibration_height", 0);
	if (cw > 0 && ch > 0) {
		calibration_ = cv::Size(cw, ch);
	} else {
		cv::Mat first = cv::imread(colour_[0], cv::IMREAD_COLOR);
		if (first.empty()) {
			throw DCL_Error("Could not read image: " << colour_[0]);
		}
		calibration_ = first.size();
	}

	loaded_ = true;

	LOG(INFO) << "Dataset " << path_ << ": " << colour_.size() << " frames, calibration "
		<< calibration_.width << "x" << calibration_.height << ", "
		<< ((frame_ == CoordinateFrame::WORLD) ? "world" : "camera") << " coordinates";
}

const Eigen::Matrix4d &Dataset::_pose(size_t ix) const {
	// All camera frame clouds share the one identity transform.
	static const Eigen::Matrix4d identity = Eigen::Matrix4d::Identity();
	return (frame_ == CoordinateFrame::WORLD) ? poses_[ix] : identity;
}

PointCloud Dataset::reconstruct(size_t ix) {
	if (!loaded_) throw DCL_Error("Dataset not loaded");
	if (ix >= size()) throw DCL_Error("Frame index out of range: " << ix);

	cv::Mat rgb = cv::imread(colour_[ix], cv::IMREAD_COLOR);
	if (rgb.empty()) {
		throw DCL_Error("Could not read image: " << colour_[ix]);
	}

	cv::Mat depth = cv::imread(depth_[ix], cv::IMREAD_ANYDEPTH);
	if (depth.empty()) {
		throw DCL_Error("Could not read depth: " << depth_[ix]);
	}
	if (depth.type() == CV_8UC1) {
		depth.convertTo(depth, CV_16UC1);
	}

	auto cam = dcl::rgbd::matchResolution(K_, calibration_, rgb, depth.size());
	return dcl::rgbd::project(rgb, depth, scale_, cam, _pose(ix));
}

FrameResult Dataset::process(size_t ix) {
	FrameResult r;
	r.name = (ix < size()) ? dcl::file_stem(colour_[ix]) : std::to_string(ix);
	r.points = 0;
	r.ok = false;

	try {
		auto cloud = reconstruct(ix);
		dcl::stream::savePLY(output_ + "/" + r.name + ".ply", cloud);
		r.points = cloud.size();
		r.ok = true;
	} catch (const dcl::exception &e) {
		r.error = e.what();
	} catch (const std::exception &e) {
		r.error = e.what();
	}

	if (!r.ok) {
		LOG(ERROR) << "Frame " << r.name << " failed: " << r.error;
	}
	return r;
}

vector<FrameResult> Dataset::processAll() {
	if (!loaded_) load();

	if (!dcl::create_directory(output_)) {
		throw DCL_Error("Could not create output folder: " << output_);
	}

	const size_t n = size();
	vector<std::future<FrameResult>> jobs;
	jobs.reserve(n);

	for (size_t i=0; i<n; ++i) {
		jobs.push_back(dcl::pool.push([this,i](int id) {
			if (!dcl::running) {
				FrameResult r;
				r.name = dcl::file_stem(colour_[i]);
				r.points = 0;
				r.ok = false;
				r.error = "Interrupted";
				return r;
			}
			return process(i);
		}));
	}

	vector<FrameResult> results;
	results.reserve(n);
	size_t failed = 0;
	size_t total = 0;

	for (size_t i=0; i<n; ++i) {
		results.push_back(jobs[i].get());
		const auto &r = results.back();
		if (r.ok) {
			total += r.points;
			LOG(INFO) << "[" << (i+1) << "/" << n << "] " << r.name << ": " << r.points << " points";
		} else {
			++failed;
			LOG(INFO) << "[" << (i+1) << "/" << n << "] " << r.name << ": " << r.error;
		}
	}

	LOG(INFO) << "Wrote " << (n - failed) << " of " << n << " point clouds (" << total << " points) to " << output_;
	if (failed > 0) {
		LOG(WARNING) << failed << " frames failed";
	}
	return results;
}
