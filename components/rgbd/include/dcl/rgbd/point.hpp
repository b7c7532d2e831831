#pragma once
#ifndef _DCL_RGBD_POINT_HPP_
#define _DCL_RGBD_POINT_HPP_

#include <cstdint>
#include <vector>

namespace dcl {
namespace rgbd {

/** Coloured 3D point, position in meters. */
struct Point {
	double x;
	double y;
	double z;
	uint8_t r;
	uint8_t g;
	uint8_t b;
};

inline bool operator==(const Point &a, const Point &b) {
	return a.x == b.x && a.y == b.y && a.z == b.z && a.r == b.r && a.g == b.g && a.b == b.b;
}

/** Points of one frame in pixel scan order. */
typedef std::vector<Point> PointCloud;

}
}

#endif  // _DCL_RGBD_POINT_HPP_
