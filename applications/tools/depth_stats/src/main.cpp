#include <dcl/configuration.hpp>
#include <dcl/configurable.hpp>
#include <dcl/rgbd/depth_stats.hpp>
#include <nlohmann/json.hpp>

#include <opencv2/imgcodecs.hpp>

#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>

#include <iostream>

using std::string;
using std::vector;

int main(int argc, char **argv) {
	auto *root = dcl::configure(argc, argv, "depth_stats");

	auto paths = root->get<vector<string>>("paths");
	if (!paths || paths->size() == 0) {
		LOG(ERROR) << "Usage: depth_stats <depth image>...";
		dcl::config::cleanup();
		return 1;
	}

	for (const auto &path : *paths) {
		cv::Mat depth = cv::imread(path, cv::IMREAD_ANYDEPTH);
		if (depth.empty()) {
			LOG(ERROR) << "Could not read depth image: " << path;
			dcl::exit_code = 1;
			continue;
		}

		try {
			auto stats = dcl::rgbd::computeDepthStats(depth);
			std::cout << path << ": " << stats << std::endl;
		} catch (const dcl::exception &e) {
			LOG(ERROR) << path << ": " << e.what();
			dcl::exit_code = 1;
		}
	}

	dcl::config::cleanup();
	return dcl::exit_code;
}
