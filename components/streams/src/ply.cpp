#include <dcl/streams/ply.hpp>
#include <dcl/exception.hpp>

#include <cstdio>
#include <fstream>

using dcl::rgbd::PointCloud;

void dcl::stream::writePLY(std::ostream &os, const PointCloud &cloud) {
	os << "ply\n"
		<< "format ascii 1.0\n"
		<< "element vertex " << cloud.size() << "\n"
		<< "property float x\n"
		<< "property float y\n"
		<< "property float z\n"
		<< "property uchar red\n"
		<< "property uchar green\n"
		<< "property uchar blue\n"
		<< "property uchar alpha\n"
		<< "end_header\n";

	// printf formatting keeps the output independent of stream locale
	char buf[256];
	for (const auto &p : cloud) {
		int n = snprintf(buf, sizeof(buf), "%f %f %f %d %d %d 0\n", p.x, p.y, p.z, int(p.r), int(p.g), int(p.b));
		if (n < 0 || n >= int(sizeof(buf))) {
			throw DCL_Error("Point does not fit output line: " << p.x << " " << p.y << " " << p.z);
		}
		os.write(buf, n);
	}
}

void dcl::stream::savePLY(const std::string &filename, const PointCloud &cloud) {
	std::ofstream out(filename, std::ios::out | std::ios::trunc);
	if (!out.is_open()) {
		throw DCL_Error("Could not open point cloud file for writing: " << filename);
	}

	writePLY(out, cloud);
	out.close();

	if (out.fail()) {
		throw DCL_Error("Failed writing point cloud file: " << filename);
	}
}
