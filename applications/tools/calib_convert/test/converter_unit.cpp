#include "catch.hpp"
#include "converter.hpp"

#include <dcl/configuration.hpp>
#include <dcl/calibration/matrix_io.hpp>
#include <nlohmann/json.hpp>

#include <opencv2/core.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

using dcl::CalibConverter;
using std::string;

static const char *kOdometry =
	"time, x, y, z, qx, qy, qz, qw\n"
	"0.0, 1, 0, 0, 0, 0, 0, 1\n"
	"0.1, 2, 0, 0, 0, 0, 0, 1\n"
	"0.2, 3, 0, 0, 0, 0, 0, 1\n"
	"0.3, 4, 0, 0, 0, 0, 0, 1\n";

static const char *kCameraCSV = "fx,skew,cx\n500,0,320\n0,500,240\n0,0,1\n";

static string makeTempDir() {
	char tmpl[] = "/tmp/dcl_convert_XXXXXX";
	char *d = mkdtemp(tmpl);
	REQUIRE( d != nullptr );
	return string(d);
}

static void removeTree(const string &path) {
	if (dcl::is_directory(path)) {
		for (const auto &f : dcl::directory_listing(path)) removeTree(f);
		::rmdir(path.c_str());
	} else {
		::unlink(path.c_str());
	}
}

static string readFile(const string &path) {
	std::ifstream in(path);
	std::stringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

TEST_CASE( "CalibConverter csv mode", "[convert]" ) {
	string dir = makeTempDir();
	nlohmann::json config = {{"mode", "csv"}};

	SECTION( "only odometry present" ) {
		std::ofstream(dir + "/odometry.csv") << kOdometry;

		CalibConverter conv(config);
		auto r = conv.convert(dir);
		REQUIRE( r.converted == 1 );
		REQUIRE( r.failed == 0 );
		REQUIRE( dcl::is_file(dir + "/poses.txt") );
		REQUIRE( !dcl::is_file(dir + "/K.txt") );
		REQUIRE( dcl::calibration::loadPoses(dir + "/poses.txt").size() == 4 );
	}

	SECTION( "only camera matrix present" ) {
		std::ofstream(dir + "/camera_matrix.csv") << kCameraCSV;

		CalibConverter conv(config);
		auto r = conv.convert(dir);
		REQUIRE( r.converted == 1 );
		REQUIRE( !dcl::is_file(dir + "/poses.txt") );

		cv::Mat K = dcl::calibration::loadCameraMatrix(dir + "/K.txt");
		REQUIRE( K.at<double>(0, 0) == 500.0 );
		REQUIRE( K.at<double>(1, 2) == 240.0 );
	}

	SECTION( "neither present" ) {
		CalibConverter conv(config);
		REQUIRE_THROWS_AS( conv.convert(dir), dcl::exception );
	}

	removeTree(dir);
}

TEST_CASE( "CalibConverter options", "[convert]" ) {
	string dir = makeTempDir();
	std::ofstream(dir + "/odometry.csv") << kOdometry;

	SECTION( "frame skip" ) {
		nlohmann::json config = {{"mode", "odometry"}, {"skip", 2}};
		CalibConverter conv(config);
		REQUIRE( conv.convert(dir).converted == 1 );

		auto poses = dcl::calibration::loadPoses(dir + "/poses.txt");
		REQUIRE( poses.size() == 2 );
		REQUIRE( poses[1](0, 3) == 3.0 );
	}

	SECTION( "skip below one" ) {
		nlohmann::json config = {{"mode", "odometry"}, {"skip", 0}};
		CalibConverter conv(config);
		REQUIRE_THROWS_AS( conv.convert(dir), dcl::exception );
		REQUIRE( !dcl::is_file(dir + "/poses.txt") );
	}

	SECTION( "unknown mode" ) {
		nlohmann::json config = {{"mode", "yaml"}};
		CalibConverter conv(config);
		REQUIRE_THROWS_AS( conv.convert(dir), dcl::exception );
	}

	SECTION( "output folder" ) {
		nlohmann::json config = {{"mode", "odometry"}, {"output", dir + "/converted"}};
		CalibConverter conv(config);
		REQUIRE( conv.convert(dir).converted == 1 );
		REQUIRE( dcl::is_file(dir + "/converted/poses.txt") );
		REQUIRE( !dcl::is_file(dir + "/poses.txt") );
	}

	SECTION( "single file input" ) {
		nlohmann::json config = {{"mode", "odometry"}};
		CalibConverter conv(config);
		REQUIRE( conv.convert(dir + "/odometry.csv").converted == 1 );
		REQUIRE( dcl::is_file(dir + "/poses.txt") );
	}

	SECTION( "single odometry file in csv mode" ) {
		nlohmann::json config = {{"mode", "csv"}, {"output", dir + "/converted"}};
		CalibConverter conv(config);
		REQUIRE( conv.convert(dir + "/odometry.csv").converted == 1 );
		REQUIRE( dcl::calibration::loadPoses(dir + "/converted/poses.txt").size() == 4 );
		REQUIRE( !dcl::is_file(dir + "/converted/K.txt") );
	}

	SECTION( "missing input" ) {
		nlohmann::json config = {{"mode", "odometry"}};
		CalibConverter conv(config);
		REQUIRE_THROWS_AS( conv.convert(dir + "/nothing"), dcl::exception );
	}

	removeTree(dir);
}

TEST_CASE( "CalibConverter txt mode", "[convert]" ) {
	string dir = makeTempDir();
	std::ofstream(dir + "/K.txt") << "500 0 320 0 500 240 0 0 1";

	SECTION( "reformat in place" ) {
		nlohmann::json config = {{"mode", "txt"}};
		CalibConverter conv(config);
		REQUIRE( conv.convert(dir).converted == 1 );

		string text = readFile(dir + "/K.txt");
		REQUIRE( text.find("5.0000000000000000e+02 0.0000000000000000e+00 3.2000000000000000e+02\n") == 0 );
	}

	SECTION( "malformed matrix counts as failed" ) {
		string sub = dir + "/broken";
		REQUIRE( dcl::create_directory(sub) );
		std::ofstream(sub + "/K.txt") << "500 0 320";

		nlohmann::json config = {{"mode", "txt"}, {"recursive", true}};
		CalibConverter conv(config);
		auto r = conv.convert(dir);
		REQUIRE( r.converted == 1 );
		REQUIRE( r.failed == 1 );
	}

	removeTree(dir);
}

TEST_CASE( "CalibConverter recursive search", "[convert]" ) {
	string dir = makeTempDir();
	REQUIRE( dcl::create_directory(dir + "/scene1") );
	REQUIRE( dcl::create_directory(dir + "/group") );
	REQUIRE( dcl::create_directory(dir + "/group/scene2") );
	std::ofstream(dir + "/scene1/odometry.csv") << kOdometry;
	std::ofstream(dir + "/group/scene2/odometry.csv") << kOdometry;

	SECTION( "top folder only without recursion" ) {
		nlohmann::json config = {{"mode", "odometry"}};
		CalibConverter conv(config);
		REQUIRE_THROWS_AS( conv.convert(dir), dcl::exception );
	}

	SECTION( "every scene in place" ) {
		nlohmann::json config = {{"mode", "odometry"}, {"recursive", true}};
		CalibConverter conv(config);
		REQUIRE( conv.convert(dir + "/").converted == 2 );
		REQUIRE( dcl::is_file(dir + "/scene1/poses.txt") );
		REQUIRE( dcl::is_file(dir + "/group/scene2/poses.txt") );
	}

	SECTION( "layout mirrored into output" ) {
		string out = dir + "/out/nested";
		nlohmann::json config = {{"mode", "odometry"}, {"recursive", true}, {"output", out}, {"skip", 4}};
		CalibConverter conv(config);
		REQUIRE( conv.convert(dir).converted == 2 );

		REQUIRE( dcl::is_file(out + "/scene1/poses.txt") );
		REQUIRE( dcl::is_file(out + "/group/scene2/poses.txt") );
		REQUIRE( !dcl::is_file(dir + "/scene1/poses.txt") );
		REQUIRE( dcl::calibration::loadPoses(out + "/scene1/poses.txt").size() == 1 );
	}

	removeTree(dir);
}
