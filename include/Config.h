#pragma once
#include <string>
#include <vector>
#include "fkYAML/node.hpp"

std::vector<std::string> split_path(const std::string& path);

class Config
{
private:
  fkyaml::node config;
  std::string source;

  const fkyaml::node* find(const std::string& key_path) const;

public:
  explicit Config(const std::string& path);
  Config(fkyaml::node root, std::string source);
  static Config fromString(const std::string& yaml);

  const std::string& path() const { return source; }
  bool has(const std::string& key_path) const;

  // Throws std::out_of_range when the path does not exist.
  const fkyaml::node& node(const std::string& key_path) const;

  template<typename T>
  T get(const std::string& key_path) const
  {
    return node(key_path).get_value<T>();
  }

  template<typename T>
  T get(const std::string& key_path, T fallback) const
  {
    if (!has(key_path)) {
      return fallback;
    }
    return get<T>(key_path);
  }

  std::vector<std::string> get_keys(const std::string& key_path) const;
};

// Reads an integer or float node as a double, rejecting anything else.
double numberValue(const fkyaml::node& node);
