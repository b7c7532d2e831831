#include "catch.hpp"
#include <dcl/rgbd/camera.hpp>
#include <dcl/exception.hpp>

#include <opencv2/core.hpp>

using dcl::rgbd::Camera;

static cv::Mat makeK(double fx, double fy, double cx, double cy) {
	cv::Mat K = cv::Mat::eye(3, 3, CV_64FC1);
	K.at<double>(0,0) = fx;
	K.at<double>(1,1) = fy;
	K.at<double>(0,2) = cx;
	K.at<double>(1,2) = cy;
	return K;
}

TEST_CASE( "scaleCameraMatrix", "[camera]" ) {
	cv::Mat K = makeK(525.0, 525.0, 319.5, 239.5);
	K.at<double>(0,1) = 0.25;

	SECTION( "halving the resolution" ) {
		cv::Mat K2 = dcl::rgbd::scaleCameraMatrix(K, {640, 480}, {320, 240});
		REQUIRE( K2.type() == CV_64FC1 );
		REQUIRE( K2.at<double>(0,0) == Approx(262.5) );
		REQUIRE( K2.at<double>(1,1) == Approx(262.5) );
		REQUIRE( K2.at<double>(0,2) == Approx(159.75) );
		REQUIRE( K2.at<double>(1,2) == Approx(119.75) );

		// Skew and last row untouched
		REQUIRE( K2.at<double>(0,1) == 0.25 );
		REQUIRE( K2.at<double>(2,2) == 1.0 );

		// Input not modified
		REQUIRE( K.at<double>(0,0) == 525.0 );
	}

	SECTION( "independent axes" ) {
		cv::Mat K2 = dcl::rgbd::scaleCameraMatrix(K, {640, 480}, {1280, 720});
		REQUIRE( K2.at<double>(0,0) == Approx(1050.0) );
		REQUIRE( K2.at<double>(1,1) == Approx(787.5) );
	}

	SECTION( "round trip restores the matrix" ) {
		cv::Mat K2 = dcl::rgbd::scaleCameraMatrix(K, {640, 480}, {1920, 1080});
		cv::Mat K3 = dcl::rgbd::scaleCameraMatrix(K2, {1920, 1080}, {640, 480});
		REQUIRE( cv::norm(K, K3, cv::NORM_INF) < 1e-9 );
	}

	SECTION( "float input" ) {
		cv::Mat Kf;
		K.convertTo(Kf, CV_32F);
		cv::Mat K2 = dcl::rgbd::scaleCameraMatrix(Kf, {640, 480}, {320, 240});
		REQUIRE( K2.type() == CV_64FC1 );
		REQUIRE( K2.at<double>(0,0) == Approx(262.5) );
	}

	SECTION( "wrong shape" ) {
		cv::Mat bad = cv::Mat::eye(4, 4, CV_64FC1);
		REQUIRE_THROWS_AS( dcl::rgbd::scaleCameraMatrix(bad, {640, 480}, {320, 240}), dcl::exception );
	}
}

TEST_CASE( "Camera::from", "[camera]" ) {
	SECTION( "valid matrix" ) {
		auto cam = Camera::from(makeK(500.0, 510.0, 320.0, 240.0), {640, 480});
		REQUIRE( cam.fx == 500.0 );
		REQUIRE( cam.fy == 510.0 );
		REQUIRE( cam.cx == 320.0 );
		REQUIRE( cam.cy == 240.0 );
		REQUIRE( cam.width == 640 );
		REQUIRE( cam.height == 480 );

		cv::Mat K = cam.getCameraMatrix();
		REQUIRE( cv::norm(K, makeK(500.0, 510.0, 320.0, 240.0), cv::NORM_INF) == 0.0 );
	}

	SECTION( "matrix at another size" ) {
		auto cam = Camera::from(makeK(500.0, 500.0, 320.0, 240.0), {640, 480});
		cv::Mat K = cam.getCameraMatrix({320, 240});
		REQUIRE( K.at<double>(0,0) == Approx(250.0) );
		REQUIRE( K.at<double>(1,2) == Approx(120.0) );
	}

	SECTION( "zero focal length" ) {
		REQUIRE_THROWS_AS( Camera::from(makeK(0.0, 500.0, 320.0, 240.0), {640, 480}), dcl::exception );
		REQUIRE_THROWS_AS( Camera::from(makeK(500.0, -1.0, 320.0, 240.0), {640, 480}), dcl::exception );
	}

	SECTION( "wrong shape" ) {
		REQUIRE_THROWS_AS( Camera::from(cv::Mat::eye(3, 4, CV_64FC1), {640, 480}), dcl::exception );
	}
}

TEST_CASE( "Camera projection", "[camera]" ) {
	auto cam = Camera::from(makeK(525.0, 525.0, 319.5, 239.5), {640, 480});

	SECTION( "screen to camera and back" ) {
		for (int v : {0, 17, 240, 479}) {
			for (int u : {0, 100, 320, 639}) {
				Eigen::Vector3d p = cam.screenToCam(u, v, 2.5);
				REQUIRE( p.z() == 2.5 );

				Eigen::Vector2d s = cam.camToScreen(p);
				REQUIRE( s.x() == Approx(u).margin(1e-9) );
				REQUIRE( s.y() == Approx(v).margin(1e-9) );
			}
		}
	}

	SECTION( "principal point lies on the optical axis" ) {
		auto c = Camera::from(makeK(500.0, 500.0, 10.0, 20.0), {64, 48});
		Eigen::Vector3d p = c.screenToCam(10, 20, 3.0);
		REQUIRE( p.x() == 0.0 );
		REQUIRE( p.y() == 0.0 );
	}
}

TEST_CASE( "matchResolution", "[camera]" ) {
	cv::Mat K = makeK(500.0, 500.0, 320.0, 240.0);

	SECTION( "matching grids use K unchanged" ) {
		cv::Mat rgb(480, 640, CV_8UC3, cv::Scalar(1,2,3));
		auto cam = dcl::rgbd::matchResolution(K, {640, 480}, rgb, {640, 480});
		REQUIRE( cam.fx == 500.0 );
		REQUIRE( cam.cx == 320.0 );
		REQUIRE( rgb.size() == cv::Size(640, 480) );
	}

	SECTION( "colour is resampled onto the depth grid" ) {
		cv::Mat rgb(480, 640, CV_8UC3, cv::Scalar(10,20,30));
		auto cam = dcl::rgbd::matchResolution(K, {640, 480}, rgb, {320, 240});

		REQUIRE( rgb.size() == cv::Size(320, 240) );
		REQUIRE( rgb.type() == CV_8UC3 );
		REQUIRE( rgb.at<cv::Vec3b>(100, 100) == cv::Vec3b(10,20,30) );

		REQUIRE( cam.width == 320 );
		REQUIRE( cam.height == 240 );
		REQUIRE( cam.fx == Approx(250.0) );
		REQUIRE( cam.cy == Approx(120.0) );
	}
}
