#include <dcl/configuration.hpp>
#include <dcl/configurable.hpp>
#include <nlohmann/json.hpp>

#include "converter.hpp"

#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>

using std::string;
using std::vector;

int main(int argc, char **argv) {
	auto *root = dcl::configure(argc, argv, "calib_convert");

	auto paths = root->get<vector<string>>("paths");
	string input = (paths && paths->size() > 0) ? (*paths)[0] : root->value("path", string("."));

	try {
		auto *converter = dcl::create<dcl::CalibConverter>(root, "converter");
		auto result = converter->convert(input);
		if (result.failed > 0) dcl::exit_code = 1;
	} catch (const dcl::exception &e) {
		LOG(ERROR) << e.what();
		dcl::exit_code = 1;
	}

	dcl::config::cleanup();
	return dcl::exit_code;
}
