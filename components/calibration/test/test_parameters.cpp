#include "catch.hpp"
#include <dcl/calibration/parameters.hpp>

#include <opencv2/core.hpp>

#include <cmath>

using cv::Mat;

namespace validate = dcl::calibration::validate;

TEST_CASE("Camera matrix", "") {
	Mat K = Mat::eye(3, 3, CV_64FC1);
	K.at<double>(0, 0) = 525.0;
	K.at<double>(1, 1) = 525.0;
	K.at<double>(0, 2) = 319.5;
	K.at<double>(1, 2) = 239.5;

	SECTION("Valid camera matrix") {
		REQUIRE(validate::cameraMatrix(K));
	}

	SECTION("Invalid last row") {
		K.at<double>(2, 0) = 1.0;
		REQUIRE(!validate::cameraMatrix(K));
	}

	SECTION("Invalid focal length") {
		K.at<double>(1, 1) = 0.0;
		REQUIRE(!validate::cameraMatrix(K));
	}

	SECTION("Wrong type") {
		Mat Kf;
		K.convertTo(Kf, CV_32F);
		REQUIRE(!validate::cameraMatrix(Kf));
	}
}

TEST_CASE("Rotation and pose", "") {
	const double a = M_PI / 6.0;
	Mat R = (cv::Mat_<double>(3, 3) <<
		std::cos(a), -std::sin(a), 0.0,
		std::sin(a),  std::cos(a), 0.0,
		0.0, 0.0, 1.0);

	SECTION("Rotation matrix") {
		REQUIRE(validate::rotationMatrix(R));
		REQUIRE(!validate::rotationMatrix(R * 2.0));
	}

	SECTION("Pose") {
		Mat T = Mat::eye(4, 4, CV_64FC1);
		R.copyTo(T(cv::Rect(0, 0, 3, 3)));
		T.at<double>(0, 3) = 1.5;
		REQUIRE(validate::pose(T));

		T.at<double>(3, 3) = 2.0;
		REQUIRE(!validate::pose(T));
	}

	SECTION("Reflection is not a pose") {
		Mat T = Mat::eye(4, 4, CV_64FC1);
		T.at<double>(2, 2) = -1.0;
		REQUIRE(validate::rotationMatrix(T(cv::Rect(0, 0, 3, 3)).clone()));
		REQUIRE(!validate::pose(T));
	}

	SECTION("Zero pose") {
		REQUIRE(!validate::pose(Mat::zeros(4, 4, CV_64FC1)));
	}
}
