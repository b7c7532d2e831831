#include <dcl/configuration.hpp>
#include <dcl/configurable.hpp>
#include <nlohmann/json.hpp>

#include "dataset.hpp"

#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>

using std::string;
using std::vector;

static int run(dcl::Configurable *root) {
	auto *dataset = dcl::create<dcl::Dataset>(root, "dataset");

	// First positional argument names the dataset folder
	auto paths = root->get<vector<string>>("paths");
	if (paths && paths->size() > 0) {
		dataset->set("path", (*paths)[0]);
	}

	dataset->load();
	auto results = dataset->processAll();

	for (const auto &r : results) {
		if (!r.ok) return 1;
	}
	return 0;
}

int main(int argc, char **argv) {
	auto *root = dcl::configure(argc, argv, "depth2cloud");

	try {
		dcl::exit_code = run(root);
	} catch (const dcl::exception &e) {
		LOG(ERROR) << "Conversion failed: " << e.what();
		dcl::exit_code = 1;
	} catch (const std::exception &e) {
		LOG(ERROR) << "Conversion failed: " << e.what();
		dcl::exit_code = 1;
	}

	dcl::config::cleanup();
	return dcl::exit_code;
}
