/**
 * @file matrix_io.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once
#ifndef _DCL_CALIBRATION_MATRIX_IO_HPP_
#define _DCL_CALIBRATION_MATRIX_IO_HPP_

#include <opencv2/core/mat.hpp>
#include <Eigen/Core>

#include <string>
#include <vector>

namespace dcl {
namespace calibration {

/**
 * Read all whitespace separated numbers from a text file. Throws if the file
 * cannot be read or contains anything else.
 */
std::vector<double> loadValues(const std::string &path);

/**
 * Read a 3x3 row-major intrinsic matrix (K.txt). Exactly nine values are
 * required. Result is CV_64FC1.
 */
cv::Mat loadCameraMatrix(const std::string &path);

/**
 * Read an intrinsic matrix from CSV. Rows of exactly three numbers are used,
 * headers and other rows are skipped; three such rows are required.
 */
cv::Mat loadCameraMatrixCSV(const std::string &path);

/**
 * Read one or more stacked row-major 4x4 camera-to-world poses (poses.txt).
 */
std::vector<Eigen::Matrix4d> loadPoses(const std::string &path);

/**
 * Read poses from an odometry CSV with columns x, y, z, qx, qy, qz, qw
 * (other columns ignored). Rows that cannot be parsed are logged and
 * skipped. With skip > 1 only every skip-th pose is returned, starting from
 * the first.
 */
std::vector<Eigen::Matrix4d> loadOdometryCSV(const std::string &path, int skip=1);

/**
 * Camera-to-world transform from a translation and a (not necessarily
 * normalised) quaternion.
 */
Eigen::Matrix4d poseFromQuaternion(double x, double y, double z, double qx, double qy, double qz, double qw);

/** One matrix row per line, values in %.16e. */
void saveCameraMatrix(const std::string &path, const cv::Mat &K);

/** One flattened row-major pose per line, values in %.16e. */
void savePoses(const std::string &path, const std::vector<Eigen::Matrix4d> &poses);

}
}

#endif  // _DCL_CALIBRATION_MATRIX_IO_HPP_
