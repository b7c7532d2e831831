#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <signal.h>
#include <dirent.h>

#include <nlohmann/json.hpp>
#include <dcl/configuration.hpp>
#include <dcl/configurable.hpp>
#include <dcl/threads.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <string>
#include <map>
#include <iostream>
#include <thread>

#ifndef DCL_VERSION
#define DCL_VERSION "unknown"
#endif

using dcl::config::json_t;
using std::ifstream;
using std::string;
using std::map;
using std::vector;
using dcl::is_file;
using dcl::is_directory;
using dcl::Configurable;

static unsigned int default_pool_size() {
	return std::max(1u, std::thread::hardware_concurrency());
}

ctpl::thread_pool dcl::pool(default_pool_size());

// Store loaded configuration
namespace dcl {
namespace config {
json_t config;
};
};

using dcl::config::config;

std::atomic_bool dcl::running = true;
int dcl::exit_code = 0;

bool dcl::is_directory(const std::string &path) {
	struct stat s;
	if (::stat(path.c_str(), &s) == 0) {
		return S_ISDIR(s.st_mode);
	} else {
		return false;
	}
}

bool dcl::is_file(const std::string &path) {
	struct stat s;
	if (::stat(path.c_str(), &s) == 0) {
		return S_ISREG(s.st_mode);
	} else {
		return false;
	}
}

std::vector<std::string> dcl::directory_listing(const std::string &path) {
	std::vector<std::string> res;

	DIR *dir;
	struct dirent *ent;
	if ((dir = opendir (path.c_str())) != NULL) {
		while ((ent = readdir (dir)) != NULL) {
			string name(ent->d_name);
			if (name == "." || name == "..") continue;
			res.push_back((path.size() > 0 && path.back() == '/') ? path + name : path + "/" + name);
		}
		closedir (dir);
	}

	std::sort(res.begin(), res.end());
	return res;
}

std::string dcl::file_stem(const std::string &path) {
	size_t slash = path.find_last_of('/');
	string name = (slash == string::npos) ? path : path.substr(slash+1);
	size_t dot = name.find_last_of('.');
	return (dot == string::npos || dot == 0) ? name : name.substr(0, dot);
}

bool dcl::create_directory(const std::string &path) {
	if (!is_directory(path)) {
		int err = ::mkdir(path.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
		// Another worker may have created it meanwhile.
		return err != -1 || is_directory(path);
	}
	return true;
}

/**
 * Combine one json config with another patch json config.
 */
static bool mergeConfig(const string path) {
	ifstream i(path.c_str());
	if (i.is_open()) {
		try {
			nlohmann::json t;
			// Comments are allowed, as in .jsonc files
			t = nlohmann::json::parse(i, nullptr, true, true);
			config.merge_patch(t);
			return true;
		} catch (nlohmann::json::parse_error& e) {
			LOG(ERROR) << "Parse error in loading config: "  << e.what();
			return false;
		}
	} else {
		return false;
	}
}

static SHARED_MUTEX mutex;
static std::map<std::string, dcl::Configurable*> config_instance;

/**
 * Find and load a JSON configuration file
 */
static bool findConfiguration(const string &file, const vector<string> &paths) {
	bool f = false;
	bool found = false;

	if (file.length() > 0) {
		f = mergeConfig(nlohmann::json::parse(file).get<string>());
		found |= f;

		if (!f) {
			LOG(ERROR) << "Specific config file (" << file << ") was not found";
		} else {
			LOG(INFO) << "Loaded config: " << file;
		}
	} else {
		f = mergeConfig("./config.json");
		found |= f;
		if (f) LOG(INFO) << "Loaded config: " << "./config.json";

		f = mergeConfig("./config.jsonc");
		found |= f;
		if (f) LOG(INFO) << "Loaded config: " << "./config.jsonc";

		for (const auto &p : paths) {
			if (is_directory(p)) {
				f = mergeConfig(p+"/config.json");
				found |= f;
				if (f) LOG(INFO) << "Loaded config: " << p << "/config.json";

				f = mergeConfig(p+"/config.jsonc");
				found |= f;
				if (f) LOG(INFO) << "Loaded config: " << p << "/config.jsonc";
			}
		}
	}

	return found;
}

/**
 * Generate a map from command line option to value. Each value is held as
 * JSON text. Anything that does not parse as JSON becomes a JSON string.
 */
map<string, string> dcl::config::read_options(char ***argv, int *argc) {
	map<string, string> opts;

	while (*argc > 0) {
		string cmd((*argv)[0]);
		if (cmd.size() < 2 || cmd[0] != '-' || cmd[1] != '-') break;

		size_t p;
		if ((p = cmd.find("=")) == string::npos) {
			opts[cmd.substr(2)] = "true";
		} else {
			auto val = cmd.substr(p+1);
			if (nlohmann::json::accept(val)) {
				opts[cmd.substr(2, p-2)] = val;
			} else {
				opts[cmd.substr(2, p-2)] = nlohmann::json(val).dump();
			}
		}

		(*argc)--;
		(*argv)++;
	}

	return opts;
}

/**
 * Put command line options into json config. Options that cannot be parsed
 * are reported and skipped.
 */
void dcl::config::applyOptions(Configurable *root, const map<string, string> &opts) {
	for (const auto &opt : opts) {
		if (opt.first == "") continue;
		if (opt.first == "config") continue;
		if (opt.first == "root") continue;

		try {
			auto v = nlohmann::json::parse(opt.second);

			if (opt.first.find('/') == string::npos) {
				root->set<json_t>(opt.first, v);
			} else {
				auto ptr = nlohmann::json::json_pointer("/"+opt.first);
				root->getConfig()[ptr] = v;
			}
		} catch(const nlohmann::json::exception &e) {
			LOG(ERROR) << "Unrecognised option: " << root->getID() << "/" << opt.first << " (" << e.what() << ")";
		}
	}
}

static bool sig_int_called = false;

static void signalIntHandler( int signum ) {
	UNUSED(signum);
	if (sig_int_called) quick_exit(-1);
	sig_int_called = true;

	// Current frames are allowed to complete.
	dcl::running = false;
}

dcl::Configurable *dcl::config::find(const std::string &uri) {
	if (uri.size() == 0) return nullptr;

	SHARED_LOCK(mutex, lk);
	auto ix = config_instance.find(uri);
	if (ix == config_instance.end()) return nullptr;
	else return (*ix).second;
}

void dcl::config::registerConfigurable(dcl::Configurable *cfg) {
	auto uri = cfg->get<string>("$id");
	if (!uri) {
		LOG(ERROR) << "Configurable object is missing $id property";
		return;
	}

	UNIQUE_LOCK(mutex, lk);
	auto ix = config_instance.find(*uri);
	if (ix != config_instance.end()) {
		throw DCL_Error("Attempting to create a duplicate object: " << *uri);
	} else {
		config_instance[*uri] = cfg;
	}
}

void dcl::config::removeConfigurable(Configurable *cfg) {
	UNIQUE_LOCK(mutex, lk);

	for (auto i=config_instance.begin(); i != config_instance.end(); ++i) {
		if (i->second == cfg) {
			config_instance.erase(i);
			break;
		}
	}
}

void dcl::config::cleanup() {
	while (true) {
		Configurable *cfg = nullptr;
		{
			SHARED_LOCK(mutex, lk);
			if (config_instance.empty()) break;
			cfg = config_instance.begin()->second;
		}
		delete cfg;
	}
}

std::string dcl::config::_getID(nlohmann::json &link) {
	if (!link["$id"].is_string()) {
		throw DCL_Error("Entity does not have $id or parent: " << link);
	}
	return link["$id"].get<std::string>();
}

nlohmann::json &dcl::config::_create(dcl::Configurable *parent, const std::string &name) {
	nlohmann::json &entity = parent->getConfig()[name];

	if (entity.is_object()) {
		if (!entity["$id"].is_string()) {
			entity["$id"] = parent->getID() + std::string("/") + name;
		}

		return entity;
	} else if (entity.is_null()) {
		// Must create the object from scratch...
		parent->getConfig()[name] = {
			// cppcheck-suppress constStatement
			{"$id", parent->getID() + std::string("/") + name}
		};

		nlohmann::json &entity2 = parent->getConfig()[name];
		return entity2;
	}

	throw DCL_Error("Unable to create Configurable entity '" << name << "'");
}

static void resizePool(Configurable *cfg) {
	int pool_size = cfg->value("threads", 0);
	if (pool_size <= 0) pool_size = static_cast<int>(default_pool_size());
	if (pool_size != dcl::pool.size()) dcl::pool.resize(pool_size);
}

Configurable *dcl::config::configure(dcl::config::json_t &cfg) {
	loguru::g_preamble_date = false;
	loguru::g_preamble_uptime = false;
	loguru::g_preamble_thread = false;
	int argc = 1;
	const char *argv[]{"d",0};
	loguru::init(argc, const_cast<char**>(argv), "--verbosity");

	cleanup();

	config = cfg;
	if (!config.contains("$id")) config["$id"] = "dcl://depthcloud";
	Configurable *rootcfg = create<Configurable>(config);
	return rootcfg;
}

Configurable *dcl::config::configure(int argc, char **argv, const std::string &root) {
	loguru::g_preamble_date = false;
	loguru::g_preamble_uptime = false;
	loguru::g_preamble_thread = false;
	loguru::init(argc, argv, "--verbosity");
	argc--;
	argv++;

	signal(SIGINT,signalIntHandler);

	// Process Arguments
	auto options = dcl::config::read_options(&argv, &argc);

	if (options.find("version") != options.end()) {
		std::cout << "depthcloud - v" << DCL_VERSION << std::endl;
		exit(0);
	}

	vector<string> paths;
	while (argc-- > 0) {
		paths.push_back(argv[0]);
		argv++;
	}

	if (!findConfiguration(options["config"], paths)) {
		LOG(WARNING) << "No configuration file found, using defaults";
	}

	string root_str = (options.find("root") != options.end()) ? nlohmann::json::parse(options["root"]).get<string>() : root;

	Configurable *rootcfg = nullptr;

	if (!config.contains("$id")) config["$id"] = "dcl://depthcloud";
	rootcfg = create<Configurable>(config);
	if (root_str.size() > 0) {
		LOG(INFO) << "Setting root to " << root_str;
		rootcfg = create<Configurable>(rootcfg, root_str);
	}

	rootcfg->set("paths", paths);
	applyOptions(rootcfg, options);
	resizePool(rootcfg);

	return rootcfg;
}
