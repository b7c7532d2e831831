#ifndef _DCL_STREAM_PLY_HPP_
#define _DCL_STREAM_PLY_HPP_

#include <dcl/rgbd/point.hpp>

#include <ostream>
#include <string>

namespace dcl {
namespace stream {

/**
 * Write an ASCII PLY document: x, y, z as float then red, green, blue and
 * alpha as uchar. Alpha is always written as 0.
 */
void writePLY(std::ostream &os, const dcl::rgbd::PointCloud &cloud);

/**
 * Write a point cloud to a PLY file, replacing any existing file. Throws if
 * the file cannot be opened or written.
 */
void savePLY(const std::string &filename, const dcl::rgbd::PointCloud &cloud);

}
}

#endif  // _DCL_STREAM_PLY_HPP_
