#include "Config.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std;

Config::Config(const string& path)
  : source(path)
{
  ifstream ifs(path);
  if (!ifs.is_open()) {
    throw runtime_error("Failed to read configuration file '" + path + "'");
  }
  try {
    config = fkyaml::node::deserialize(ifs);
  } catch (const fkyaml::exception& e) {
    throw runtime_error("Failed to parse YAML configuration from '" + path +
                        "': " + e.what());
  }
}

Config::Config(fkyaml::node root, string source)
  : config(std::move(root))
  , source(std::move(source))
{
}

Config
Config::fromString(const string& yaml)
{
  try {
    return Config(fkyaml::node::deserialize(yaml), "<string>");
  } catch (const fkyaml::exception& e) {
    throw runtime_error(string("Failed to parse YAML configuration: ") +
                        e.what());
  }
}

vector<string>
split_path(const string& path)
{
  vector<string> parts;
  size_t start = 0, end;

  while ((end = path.find('.', start)) != string::npos) {
    parts.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  parts.push_back(path.substr(start));
  return parts;
}

const fkyaml::node*
Config::find(const string& key_path) const
{
  const fkyaml::node* current = &config;
  for (const auto& part : split_path(key_path)) {
    if (!current->is_mapping() || !current->contains(part)) {
      return nullptr;
    }
    current = &current->at(part);
  }
  return current;
}

bool
Config::has(const string& key_path) const
{
  auto found = find(key_path);
  return found != nullptr && !found->is_null();
}

const fkyaml::node&
Config::node(const string& key_path) const
{
  auto found = find(key_path);
  if (found == nullptr) {
    throw out_of_range("missing configuration value '" + key_path + "'");
  }
  return *found;
}

vector<string>
Config::get_keys(const string& key_path) const
{
  vector<string> keys;
  auto current = find(key_path);

  if (current != nullptr && current->is_mapping()) {
    for (auto it = current->begin(); it != current->end(); ++it) {
      keys.push_back(it.key().get_value<string>());
    }
  }

  return keys;
}

double
numberValue(const fkyaml::node& node)
{
  if (node.is_integer()) {
    return static_cast<double>(node.get_value<int64_t>());
  }
  if (node.is_float_number()) {
    return node.get_value<double>();
  }
  stringstream ss;
  ss << "expected a number but found '" << fkyaml::node::serialize(node) << "'";
  throw invalid_argument(ss.str());
}
