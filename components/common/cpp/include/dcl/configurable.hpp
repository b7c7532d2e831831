/**
 * @file configurable.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once
#ifndef _DCL_CONFIGURABLE_HPP_
#define _DCL_CONFIGURABLE_HPP_

#include <dcl/exception.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>
#include <optional>

namespace dcl {

/**
 * The Configurable class should be inherited by, or handed to, any entity
 * that is to be configured using json objects.
 *
 * A configurable with a "$id" property is indexed so that it can be found
 * again with dcl::config::find() and is released by dcl::config::cleanup().
 */
class Configurable {
	public:
	explicit Configurable(nlohmann::json &config);
	virtual ~Configurable();

	/**
	 * Return raw JSON entity for this Configurable.
	 */
	nlohmann::json &getConfig() { return *config_; }

	/**
	 * Get a configuration property from the json object. Returns an optional
	 * result which will be empty if the property does not exist or is not of
	 * the requested type.
	 */
	template <typename T>
	std::optional<T> get(const std::string &name);

	std::string getID();

	bool has(const std::string &name) const;

	/**
	 * Get a configuration property, but return a default if not found.
	 */
	template <typename T>
	T value(const std::string &name, const T &def);

	/**
	 * Change a configuration property.
	 */
	template <typename T>
	void set(const std::string &name, T value);

	protected:
	nlohmann::json *config_;
};

}

#include <dcl/configuration.hpp>

extern template bool dcl::Configurable::value<bool>(const std::string &name, const bool &def);
extern template int dcl::Configurable::value<int>(const std::string &name, const int &def);
extern template double dcl::Configurable::value<double>(const std::string &name, const double &def);
extern template std::string dcl::Configurable::value<std::string>(const std::string &name, const std::string &def);

extern template std::optional<bool> dcl::Configurable::get<bool>(const std::string &name);
extern template std::optional<int> dcl::Configurable::get<int>(const std::string &name);
extern template std::optional<double> dcl::Configurable::get<double>(const std::string &name);
extern template std::optional<std::string> dcl::Configurable::get<std::string>(const std::string &name);
extern template std::optional<std::vector<std::string>> dcl::Configurable::get<std::vector<std::string>>(const std::string &name);

extern template void dcl::Configurable::set<bool>(const std::string &name, bool value);
extern template void dcl::Configurable::set<int>(const std::string &name, int value);
extern template void dcl::Configurable::set<double>(const std::string &name, double value);
extern template void dcl::Configurable::set<std::string>(const std::string &name, std::string value);
extern template void dcl::Configurable::set<std::vector<std::string>>(const std::string &name, std::vector<std::string> value);
extern template void dcl::Configurable::set<nlohmann::json>(const std::string &name, nlohmann::json value);

#endif  // _DCL_CONFIGURABLE_HPP_
