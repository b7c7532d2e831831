#include "converter.hpp"

#include <dcl/configuration.hpp>
#include <dcl/calibration/matrix_io.hpp>
#include <dcl/calibration/parameters.hpp>
#include <nlohmann/json.hpp>

#include <opencv2/core.hpp>

#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>

using dcl::CalibConverter;
using dcl::ConvertResult;
using std::string;
using std::vector;

static string parentOf(const string &path) {
	size_t slash = path.find_last_of('/');
	if (slash == string::npos) return ".";
	if (slash == 0) return "/";
	return path.substr(0, slash);
}

static string fileName(const string &path) {
	size_t slash = path.find_last_of('/');
	return (slash == string::npos) ? path : path.substr(slash+1);
}

static bool createDirectories(const string &path) {
	size_t p = 0;
	while ((p = path.find('/', p+1)) != string::npos) {
		if (!dcl::create_directory(path.substr(0, p))) return false;
	}
	return dcl::create_directory(path);
}

static void findDirectories(const string &dir, vector<string> &dirs) {
	dirs.push_back(dir);
	for (const auto &entry : dcl::directory_listing(dir)) {
		if (dcl::is_directory(entry)) findDirectories(entry, dirs);
	}
}

CalibConverter::CalibConverter(nlohmann::json &config) : dcl::Configurable(config), skip_(1) {
}

CalibConverter::~CalibConverter() {
}

void CalibConverter::_jobsFor(const string &dir, const string &outdir, vector<Job> &jobs) {
	const string intrinsics = value("intrinsics", string("K.txt"));
	const string poses = value("poses", string("poses.txt"));

	if (mode_ == "txt") {
		string in = dir + "/" + intrinsics;
		if (dcl::is_file(in)) jobs.push_back({in, outdir + "/" + intrinsics, false});
		return;
	}

	if (mode_ == "csv") {
		string in = dir + "/" + value("camera_csv", string("camera_matrix.csv"));
		if (dcl::is_file(in)) jobs.push_back({in, outdir + "/" + intrinsics, false});
	}

	string in = dir + "/" + value("odometry_csv", string("odometry.csv"));
	if (dcl::is_file(in)) jobs.push_back({in, outdir + "/" + poses, true});
}

void CalibConverter::_run(const Job &job) {
	if (!createDirectories(parentOf(job.out))) {
		throw DCL_Error("Could not create output folder for " << job.out);
	}

	if (job.odometry) {
		auto poses = dcl::calibration::loadOdometryCSV(job.in, skip_);
		dcl::calibration::savePoses(job.out, poses);
		LOG(INFO) << job.in << " -> " << job.out << " (" << poses.size() << " poses)";
		return;
	}

	cv::Mat K = (mode_ == "csv") ? dcl::calibration::loadCameraMatrixCSV(job.in)
		: dcl::calibration::loadCameraMatrix(job.in);
	if (!dcl::calibration::validate::cameraMatrix(K)) {
		LOG(WARNING) << "Not a valid camera matrix: " << job.in;
	}
	dcl::calibration::saveCameraMatrix(job.out, K);
	LOG(INFO) << job.in << " -> " << job.out << ":\n" << K;
}

ConvertResult CalibConverter::convert(const string &input) {
	mode_ = value("mode", string("txt"));
	if (mode_ != "txt" && mode_ != "csv" && mode_ != "odometry") {
		throw DCL_Error("Unknown mode '" << mode_ << "', expected txt, csv or odometry");
	}

	skip_ = value("skip", 1);
	if (skip_ < 1) throw DCL_Error("skip must be at least 1: " << skip_);

	const string output = value("output", string(""));
	vector<Job> jobs;

	if (dcl::is_file(input)) {
		// In csv mode a lone file is an odometry log only by name
		const bool odometry = mode_ == "odometry" || (mode_ == "csv" &&
			fileName(input) == value("odometry_csv", string("odometry.csv")));
		const string outdir = (output.size() > 0) ? output : parentOf(input);
		string out;
		if (odometry) {
			out = outdir + "/" + value("poses", string("poses.txt"));
		} else if (mode_ == "txt") {
			out = outdir + "/" + fileName(input);
		} else {
			out = outdir + "/" + value("intrinsics", string("K.txt"));
		}
		jobs.push_back({input, out, odometry});
	} else if (dcl::is_directory(input)) {
		string root = input;
		while (root.size() > 1 && root.back() == '/') root.pop_back();

		vector<string> dirs;
		if (value("recursive", false)) {
			findDirectories(root, dirs);
		} else {
			dirs.push_back(root);
		}

		for (const auto &dir : dirs) {
			string outdir = (output.size() > 0) ? output + dir.substr(root.size()) : dir;
			_jobsFor(dir, outdir, jobs);
		}

		if (jobs.empty()) {
			throw DCL_Error("Nothing to convert for mode '" << mode_ << "' in " << input);
		}
	} else {
		throw DCL_Error("Input does not exist: " << input);
	}

	ConvertResult result = {0, 0};
	for (const auto &job : jobs) {
		try {
			_run(job);
			++result.converted;
		} catch (const dcl::exception &e) {
			LOG(ERROR) << "Failed to convert " << fileName(job.in) << ": " << e.what();
			++result.failed;
		}
	}

	LOG(INFO) << "Converted " << result.converted << " of " << jobs.size() << " files";
	return result;
}
