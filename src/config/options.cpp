// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "config/options.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <fstream>
#include <random>

namespace synclink {
namespace config {

const std::vector<std::string>& DefaultStunServers() {
  static const std::vector<std::string> servers = {
      "stun.callwithus.com:3478",
      "stun.counterpath.com:3478",
      "stun.counterpath.net:3478",
      "stun.ekiga.net:3478",
      "stun.ideasip.com:3478",
      "stun.internetcalls.com:3478",
      "stun.schlund.de:3478",
      "stun.sipgate.net:10000",
      "stun.sipgate.net:3478",
      "stun.voip.aebc.com:3478",
      "stun.voiparound.com:3478",
      "stun.voipbuster.com:3478",
      "stun.voipstunt.com:3478",
      "stun.voxgratia.org:3478",
      "stun.xten.com:3478",
  };
  return servers;
}

Options ConfigWrapper::GetOptions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return options_;
}

void ConfigWrapper::SetOptions(Options options) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_ = std::move(options);
}

std::vector<std::string> ConfigWrapper::StunServers() const {
  std::vector<std::string> configured;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    configured = options_.stun_servers;
  }

  std::vector<std::string> servers;
  for (const auto& entry : configured) {
    if (entry == "default") {
      // Spread load across the public servers
      std::vector<std::string> defaults = DefaultStunServers();
      std::random_device rd;
      std::mt19937 gen(rd());
      std::shuffle(defaults.begin(), defaults.end(), gen);
      servers.insert(servers.end(), defaults.begin(), defaults.end());
    } else if (!entry.empty() &&
               entry.find_first_not_of(" \t") != std::string::npos) {
      servers.push_back(entry);
    }
  }
  return servers;
}

std::optional<Options> LoadOptionsFromJson(const nlohmann::json& root) {
  using json = nlohmann::json;

  Options options;
  if (!root.is_object()) {
    LOG_CONFIG_WARN("config root is not a JSON object");
    return std::nullopt;
  }
  if (!root.contains("options")) {
    return options;
  }

  const json& opts = root["options"];
  if (!opts.is_object()) {
    LOG_CONFIG_WARN("config 'options' is not a JSON object");
    return std::nullopt;
  }

  auto string_array = [](const json& value, std::vector<std::string>& out) {
    if (!value.is_array()) {
      return false;
    }
    std::vector<std::string> parsed;
    for (const auto& item : value) {
      if (!item.is_string()) {
        return false;
      }
      parsed.push_back(item.get<std::string>());
    }
    out = std::move(parsed);
    return true;
  };

  if (opts.contains("stunKeepaliveSeconds")) {
    if (!opts["stunKeepaliveSeconds"].is_number_integer()) {
      LOG_CONFIG_WARN("config 'stunKeepaliveSeconds' must be an integer");
      return std::nullopt;
    }
    options.stun_keepalive_s = opts["stunKeepaliveSeconds"].get<int>();
  }

  if (opts.contains("natEnabled")) {
    if (!opts["natEnabled"].is_boolean()) {
      LOG_CONFIG_WARN("config 'natEnabled' must be a boolean");
      return std::nullopt;
    }
    options.nat_enabled = opts["natEnabled"].get<bool>();
  }

  if (opts.contains("stunServers") &&
      !string_array(opts["stunServers"], options.stun_servers)) {
    LOG_CONFIG_WARN("config 'stunServers' must be an array of strings");
    return std::nullopt;
  }

  if (opts.contains("listenAddresses") &&
      !string_array(opts["listenAddresses"], options.listen_addresses)) {
    LOG_CONFIG_WARN("config 'listenAddresses' must be an array of strings");
    return std::nullopt;
  }

  if (opts.contains("intakeCapacity")) {
    const json& capacity = opts["intakeCapacity"];
    if (!capacity.is_number_integer() || capacity.get<int64_t>() <= 0) {
      LOG_CONFIG_WARN("config 'intakeCapacity' must be a positive integer");
      return std::nullopt;
    }
    options.intake_capacity = capacity.get<size_t>();
  }

  return options;
}

std::optional<Options> LoadOptionsFromFile(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_CONFIG_WARN("failed to open config file {}", path.string());
    return std::nullopt;
  }

  nlohmann::json root = nlohmann::json::parse(file, nullptr, false);
  if (root.is_discarded()) {
    LOG_CONFIG_WARN("failed to parse config file {}", path.string());
    return std::nullopt;
  }

  auto options = LoadOptionsFromJson(root);
  if (options) {
    LOG_CONFIG_DEBUG("loaded config from {} ({} STUN servers, keepalive {}s)",
                     path.string(), options->stun_servers.size(),
                     options->stun_keepalive_s);
  }
  return options;
}

nlohmann::json OptionsToJson(const Options& options) {
  nlohmann::json opts;
  opts["stunKeepaliveSeconds"] = options.stun_keepalive_s;
  opts["natEnabled"] = options.nat_enabled;
  opts["stunServers"] = options.stun_servers;
  opts["listenAddresses"] = options.listen_addresses;
  opts["intakeCapacity"] = options.intake_capacity;

  nlohmann::json root;
  root["options"] = opts;
  return root;
}

} // namespace config
} // namespace synclink
