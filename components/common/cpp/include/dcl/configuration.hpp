/**
 * @file configuration.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once
#ifndef _DCL_COMMON_CONFIGURATION_HPP_
#define _DCL_COMMON_CONFIGURATION_HPP_

#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <string>
#include <vector>
#include <map>

namespace dcl {

extern std::atomic_bool running;	///< Set to false to bring the system down
extern int exit_code;				///< Specify exit code to eventually use

class Configurable;

bool is_directory(const std::string &path);
bool is_file(const std::string &path);
bool create_directory(const std::string &path);

/**
 * Sorted full paths of the entries in a directory, excluding "." and "..".
 * An empty result is returned if the directory cannot be opened.
 */
std::vector<std::string> directory_listing(const std::string &path);

/**
 * Final path component without its extension, "dir/000135.png" -> "000135".
 */
std::string file_stem(const std::string &path);

namespace config {

typedef nlohmann::json json_t;

std::map<std::string, std::string> read_options(char ***argv, int *argc);

/**
 * Called first to set up the entire system. Initialises logging, merges the
 * configuration file and applies command line options to the root object.
 *
 * @param root The initial key in the config file to use as root config.
 */
Configurable *configure(int argc, char **argv, const std::string &root);

Configurable *configure(json_t &);

void cleanup();

void removeConfigurable(Configurable *cfg);

/**
 * Apply "--name=value" options to a configurable. Values are parsed as
 * JSON and a name containing '/' addresses a nested property.
 */
void applyOptions(Configurable *cfg, const std::map<std::string, std::string> &opts);

/**
 * Find an existing instance of a Configurable object by its $id, or return
 * nullptr if not found.
 */
Configurable *find(const std::string &uri);

/**
 * Adds a Configurable instance to the database of instances so that it can
 * then be resolved using find().
 */
void registerConfigurable(Configurable *cfg);

/**
 * Create a new configurable directly from a raw object. This should not be used.
 */
template <typename T, typename... ARGS>
T *create(json_t &link, ARGS ...args);

/**
 * Create a configurable from an attribute of a parent configurable.
 */
template <typename T, typename... ARGS>
T *create(dcl::Configurable *parent, const std::string &name, ARGS ...args);

nlohmann::json &_create(dcl::Configurable *parent, const std::string &name);

std::string _getID(nlohmann::json &);

}  // namespace config

using config::create;
using config::configure;

}  // namespace dcl

#include <dcl/configurable.hpp>

template <typename T, typename... ARGS>
T *dcl::config::create(json_t &link, ARGS ...args) {
	std::string id = _getID(link);

	dcl::Configurable *cfg = dcl::config::find(id);
	if (!cfg) {
		cfg = new T(link, args...);
	}

	T* ptr = dynamic_cast<T*>(cfg);
	if (ptr) {
		return ptr;
	}
	else {
		throw DCL_Error("Configuration object is of wrong type: " << id);
	}
}

template <typename T, typename... ARGS>
T *dcl::config::create(dcl::Configurable *parent, const std::string &name, ARGS ...args) {
	return create<T>(_create(parent, name), args...);
}

#endif  // _DCL_COMMON_CONFIGURATION_HPP_
