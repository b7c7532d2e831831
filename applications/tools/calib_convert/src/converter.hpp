#ifndef _DCL_CALIB_CONVERT_CONVERTER_HPP_
#define _DCL_CALIB_CONVERT_CONVERTER_HPP_

#include <dcl/configurable.hpp>

#include <string>
#include <vector>

namespace dcl {

struct ConvertResult {
	size_t converted;
	size_t failed;
};

/**
 * Rewrites camera intrinsics and poses into the K.txt / poses.txt text
 * layout read by depth2cloud.
 *
 * Properties:
 *   mode          "txt" reformats K.txt, "csv" converts camera_matrix.csv
 *                 and odometry.csv, "odometry" converts odometry.csv only
 *   skip          Keep every skip-th odometry pose
 *   output        Output folder (or file, for a file input). Empty writes
 *                 next to the input.
 *   recursive     Search all sub-folders, mirroring them under output
 *   intrinsics, poses, camera_csv, odometry_csv
 *                 File names
 */
class CalibConverter : public dcl::Configurable {
	public:
	explicit CalibConverter(nlohmann::json &config);
	~CalibConverter();

	/**
	 * Convert a single file or every matching file in a folder. A file that
	 * fails is logged and counted, the rest are still converted. Throws for
	 * bad options or when there is nothing to convert.
	 */
	ConvertResult convert(const std::string &input);

	private:
	struct Job {
		std::string in;
		std::string out;
		bool odometry;
	};

	std::string mode_;
	int skip_;

	void _jobsFor(const std::string &dir, const std::string &outdir, std::vector<Job> &jobs);
	void _run(const Job &job);
};

}

#endif  // _DCL_CALIB_CONVERT_CONVERTER_HPP_
