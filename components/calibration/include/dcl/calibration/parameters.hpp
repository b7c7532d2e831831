#pragma once
#ifndef _DCL_CALIBRATION_PARAMETERS_HPP_
#define _DCL_CALIBRATION_PARAMETERS_HPP_

#include <opencv2/core/mat.hpp>

namespace dcl {
namespace calibration {

namespace validate {

/**
 * @brief 3x3 double matrix with a determinant of +/-1.
 */
bool rotationMatrix(const cv::Mat &M);

/**
 * @brief 4x4 homogeneous rigid transform: rotation block with a determinant
 * of +1 and last row (0, 0, 0, 1).
 */
bool pose(const cv::Mat &M);

/**
 * @brief 3x3 double pinhole camera matrix with last row (0, 0, 1) and
 * positive focal lengths.
 */
bool cameraMatrix(const cv::Mat &M);

}

}
}

#endif
