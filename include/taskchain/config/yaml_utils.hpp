#pragma once

#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace YAML {

template <typename Tag>
struct convert<taskchain::TypedId<Tag>> {
  static auto encode(const taskchain::TypedId<Tag>& id) -> Node {
    return Node(std::string(id.value()));
  }
  static auto decode(const Node& node, taskchain::TypedId<Tag>& id) -> bool {
    if (!node.IsScalar()) return false;
    id = taskchain::TypedId<Tag>{node.as<std::string>()};
    return true;
  }
};

}  // namespace YAML

namespace taskchain {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

// Scalars keep their YAML spelling unless they read as a bool or a number.
[[nodiscard]] inline auto yaml_to_json(const YAML::Node& node)
    -> nlohmann::json {
  switch (node.Type()) {
    case YAML::NodeType::Sequence: {
      auto out = nlohmann::json::array();
      for (const auto& item : node) {
        out.push_back(yaml_to_json(item));
      }
      return out;
    }
    case YAML::NodeType::Map: {
      auto out = nlohmann::json::object();
      for (const auto& kv : node) {
        out[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return out;
    }
    case YAML::NodeType::Scalar: {
      if (node.Tag() == "!") {
        return node.Scalar();
      }
      bool b{};
      if (YAML::convert<bool>::decode(node, b)) return b;
      long long i{};
      if (YAML::convert<long long>::decode(node, i)) return i;
      double d{};
      if (YAML::convert<double>::decode(node, d)) return d;
      return node.Scalar();
    }
    default:
      return nullptr;
  }
}

}  // namespace taskchain
