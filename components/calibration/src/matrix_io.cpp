#include <dcl/calibration/matrix_io.hpp>
#include <dcl/exception.hpp>

#include <opencv2/core.hpp>
#include <Eigen/Geometry>

#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>

#include <cstdio>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>

using std::string;
using std::vector;

static bool parseDouble(const string &tok, double &v) {
	try {
		size_t pos = 0;
		v = std::stod(tok, &pos);
		return pos == tok.size();
	} catch (const std::invalid_argument &) {
		return false;
	} catch (const std::out_of_range &) {
		return false;
	}
}

static string trim(const string &s) {
	size_t b = s.find_first_not_of(" \t\r\n");
	if (b == string::npos) return "";
	size_t e = s.find_last_not_of(" \t\r\n");
	return s.substr(b, e-b+1);
}

static vector<string> splitCSV(const string &line) {
	vector<string> cells;
	size_t start = 0;
	while (true) {
		size_t comma = line.find(',', start);
		cells.push_back(trim(line.substr(start, (comma == string::npos) ? string::npos : comma-start)));
		if (comma == string::npos) break;
		start = comma+1;
	}
	return cells;
}

vector<double> dcl::calibration::loadValues(const string &path) {
	std::ifstream in(path);
	if (!in.is_open()) {
		throw DCL_Error("Could not open matrix file: " << path);
	}

	vector<double> values;
	string tok;
	while (in >> tok) {
		double v;
		if (!parseDouble(tok, v)) {
			throw DCL_Error("Invalid number '" << tok << "' in " << path);
		}
		values.push_back(v);
	}

	if (in.bad()) {
		throw DCL_Error("Failed reading matrix file: " << path);
	}
	return values;
}

cv::Mat dcl::calibration::loadCameraMatrix(const string &path) {
	auto values = loadValues(path);
	if (values.size() != 9) {
		throw DCL_Error("Camera matrix needs 9 values, " << path << " has " << values.size());
	}

	cv::Mat K(3, 3, CV_64FC1);
	for (int i=0; i<9; ++i) K.at<double>(i/3, i%3) = values[i];
	return K;
}

cv::Mat dcl::calibration::loadCameraMatrixCSV(const string &path) {
	std::ifstream in(path);
	if (!in.is_open()) {
		throw DCL_Error("Could not open camera CSV: " << path);
	}

	vector<vector<double>> rows;
	string line;
	while (std::getline(in, line)) {
		vector<double> row;
		bool numeric = true;
		for (const auto &cell : splitCSV(line)) {
			if (cell.empty()) continue;
			double v;
			if (!parseDouble(cell, v)) { numeric = false; break; }
			row.push_back(v);
		}
		if (numeric && row.size() == 3) rows.push_back(row);
	}

	if (rows.size() != 3) {
		throw DCL_Error("Camera CSV should contain a 3x3 matrix, " << path << " has " << rows.size() << " rows");
	}

	cv::Mat K(3, 3, CV_64FC1);
	for (int r=0; r<3; ++r) {
		for (int c=0; c<3; ++c) K.at<double>(r,c) = rows[r][c];
	}
	return K;
}

vector<Eigen::Matrix4d> dcl::calibration::loadPoses(const string &path) {
	auto values = loadValues(path);
	if (values.size() == 0 || values.size() % 16 != 0) {
		throw DCL_Error("Pose file must hold whole 4x4 matrices, " << path << " has " << values.size() << " values");
	}

	vector<Eigen::Matrix4d> poses(values.size() / 16);
	for (size_t i=0; i<poses.size(); ++i) {
		poses[i] = Eigen::Map<const Eigen::Matrix<double,4,4,Eigen::RowMajor>>(values.data() + i*16);
	}
	return poses;
}

Eigen::Matrix4d dcl::calibration::poseFromQuaternion(double x, double y, double z, double qx, double qy, double qz, double qw) {
	Eigen::Quaterniond q(qw, qx, qy, qz);
	if (q.norm() == 0.0) {
		throw DCL_Error("Zero length quaternion");
	}
	q.normalize();

	Eigen::Matrix4d pose = Eigen::Matrix4d::Identity();
	pose.block<3,3>(0,0) = q.toRotationMatrix();
	pose.block<3,1>(0,3) = Eigen::Vector3d(x, y, z);
	return pose;
}

vector<Eigen::Matrix4d> dcl::calibration::loadOdometryCSV(const string &path, int skip) {
	std::ifstream in(path);
	if (!in.is_open()) {
		throw DCL_Error("Could not open odometry CSV: " << path);
	}

	string line;
	if (!std::getline(in, line)) {
		throw DCL_Error("Odometry CSV is empty: " << path);
	}

	static const vector<string> required = {"x", "y", "z", "qx", "qy", "qz", "qw"};

	auto header = splitCSV(line);
	std::map<string,size_t> columns;
	for (size_t i=0; i<header.size(); ++i) columns[header[i]] = i;

	vector<size_t> index;
	string missing;
	for (const auto &name : required) {
		auto ix = columns.find(name);
		if (ix == columns.end()) missing += " " + name;
		else index.push_back(ix->second);
	}
	if (!missing.empty()) {
		throw DCL_Error("Odometry CSV " << path << " is missing columns:" << missing);
	}

	vector<Eigen::Matrix4d> poses;
	int lineno = 1;
	int count = 0;
	while (std::getline(in, line)) {
		++lineno;
		if (trim(line).empty()) continue;

		auto cells = splitCSV(line);
		double v[7];
		bool ok = true;
		for (size_t i=0; i<index.size(); ++i) {
			if (index[i] >= cells.size() || !parseDouble(cells[index[i]], v[i])) {
				ok = false;
				break;
			}
		}

		if (!ok || Eigen::Vector4d(v[3], v[4], v[5], v[6]).norm() == 0.0) {
			LOG(WARNING) << "Skipping invalid odometry row " << lineno << " in " << path;
			continue;
		}

		if (skip <= 1 || count % skip == 0) {
			poses.push_back(poseFromQuaternion(v[0], v[1], v[2], v[3], v[4], v[5], v[6]));
		}
		++count;
	}

	if (skip > 1) {
		LOG(INFO) << "Kept " << poses.size() << " of " << count << " poses (every " << skip << ")";
	}
	return poses;
}

namespace {
struct FileCloser {
	void operator()(FILE *fp) const { fclose(fp); }
};
}

static void writeRows(const string &path, const vector<vector<double>> &rows) {
	std::unique_ptr<FILE, FileCloser> fp(fopen(path.c_str(), "w"));
	if (!fp) {
		throw DCL_Error("Could not open for writing: " << path);
	}

	for (const auto &row : rows) {
		for (size_t i=0; i<row.size(); ++i) {
			if (fprintf(fp.get(), (i == 0) ? "%.16e" : " %.16e", row[i]) < 0) {
				throw DCL_Error("Failed writing: " << path);
			}
		}
		if (fputc('\n', fp.get()) == EOF) {
			throw DCL_Error("Failed writing: " << path);
		}
	}

	if (fclose(fp.release()) != 0) {
		throw DCL_Error("Failed writing: " << path);
	}
}

void dcl::calibration::saveCameraMatrix(const string &path, const cv::Mat &K) {
	if (K.rows != 3 || K.cols != 3 || K.channels() != 1) {
		throw DCL_Error("Camera matrix must be 3x3, got " << K.rows << "x" << K.cols);
	}

	cv::Mat K64;
	K.convertTo(K64, CV_64F);

	vector<vector<double>> rows(3);
	for (int r=0; r<3; ++r) {
		for (int c=0; c<3; ++c) rows[r].push_back(K64.at<double>(r,c));
	}
	writeRows(path, rows);
}

void dcl::calibration::savePoses(const string &path, const vector<Eigen::Matrix4d> &poses) {
	vector<vector<double>> rows;
	rows.reserve(poses.size());
	for (const auto &pose : poses) {
		vector<double> row;
		for (int r=0; r<4; ++r) {
			for (int c=0; c<4; ++c) row.push_back(pose(r,c));
		}
		rows.push_back(row);
	}
	writeRows(path, rows);
}
