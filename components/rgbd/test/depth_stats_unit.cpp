#include "catch.hpp"
#include <dcl/rgbd/depth_stats.hpp>
#include <dcl/exception.hpp>

#include <opencv2/core.hpp>
#include <sstream>

using dcl::rgbd::computeDepthStats;

TEST_CASE( "computeDepthStats", "[depth]" ) {
	SECTION( "mixed valid and missing depth" ) {
		cv::Mat depth = (cv::Mat_<uint16_t>(2,2) << 0, 1000, 3000, 0);
		auto s = computeDepthStats(depth);

		REQUIRE( s.type == CV_16UC1 );
		REQUIRE( s.size == cv::Size(2,2) );
		REQUIRE( s.min == 0.0 );
		REQUIRE( s.max == 3000.0 );
		REQUIRE( s.mean == Approx(1000.0) );
		REQUIRE( s.valid == 2 );
		REQUIRE( s.validMin == 1000.0 );
		REQUIRE( s.validMax == 3000.0 );
		REQUIRE( s.validMean == Approx(2000.0) );

		std::stringstream ss;
		ss << s;
		REQUIRE( ss.str().find("CV_16UC1") != std::string::npos );
		REQUIRE( ss.str().find("valid=2") != std::string::npos );
	}

	SECTION( "no valid pixels" ) {
		auto s = computeDepthStats(cv::Mat::zeros(3, 3, CV_16UC1));
		REQUIRE( s.valid == 0 );
		REQUIRE( s.validMax == 0.0 );
		REQUIRE( s.stddev == 0.0 );
	}

	SECTION( "invalid images" ) {
		REQUIRE_THROWS_AS( computeDepthStats(cv::Mat()), dcl::exception );
		REQUIRE_THROWS_AS( computeDepthStats(cv::Mat(2, 2, CV_8UC3)), dcl::exception );
	}
}
