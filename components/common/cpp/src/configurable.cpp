#define LOGURU_REPLACE_GLOG 1
#include <loguru.hpp>
#include <dcl/configurable.hpp>

#include <nlohmann/json.hpp>

using dcl::Configurable;
using std::string;
using dcl::config::json_t;

Configurable::Configurable(nlohmann::json &config) : config_(&config) {
	if (!config.is_object()) {
		throw DCL_Error("Configurable json is not an object: " << config);
	}

	if (config.contains("$id")) {
		dcl::config::registerConfigurable(this);
	}
}

Configurable::~Configurable() {
	dcl::config::removeConfigurable(this);
}

std::string Configurable::getID() {
	return get<std::string>("$id").value_or("");
}

template <typename T>
T dcl::Configurable::value(const std::string &name, const T &def) {
	auto r = get<T>(name);
	if (r) return *r;
	(*config_)[name] = def;
	return def;
}

template <typename T>
void dcl::Configurable::set(const std::string &name, T value) {
	(*config_)[name] = value;
}

template <typename T>
std::optional<T> dcl::Configurable::get(const std::string &name) {
	if (!config_->is_object() && !config_->is_null()) throw DCL_Error("Config is not an object");
	auto ix = config_->find(name);
	if (ix != config_->end() && !ix->is_null()) {
		try {
			return ix->get<T>();
		} catch (const nlohmann::json::exception &e) {
			DLOG(1) << "Property '" << name << "' has wrong type: " << e.what();
			return {};
		}
	} else {
		return {};
	}
}

template bool dcl::Configurable::value<bool>(const std::string &name, const bool &def);
template int dcl::Configurable::value<int>(const std::string &name, const int &def);
template double dcl::Configurable::value<double>(const std::string &name, const double &def);
template std::string dcl::Configurable::value<std::string>(const std::string &name, const std::string &def);

template std::optional<bool> dcl::Configurable::get<bool>(const std::string &name);
template std::optional<int> dcl::Configurable::get<int>(const std::string &name);
template std::optional<double> dcl::Configurable::get<double>(const std::string &name);
template std::optional<std::string> dcl::Configurable::get<std::string>(const std::string &name);
template std::optional<std::vector<std::string>> dcl::Configurable::get<std::vector<std::string>>(const std::string &name);

template void dcl::Configurable::set<bool>(const std::string &name, bool value);
template void dcl::Configurable::set<int>(const std::string &name, int value);
template void dcl::Configurable::set<double>(const std::string &name, double value);
template void dcl::Configurable::set<std::string>(const std::string &name, std::string value);
template void dcl::Configurable::set<std::vector<std::string>>(const std::string &name, std::vector<std::string> value);
template void dcl::Configurable::set<nlohmann::json>(const std::string &name, nlohmann::json value);

bool dcl::Configurable::has(const std::string &name) const {
	return (config_) ? config_->contains(name) : false;
}
