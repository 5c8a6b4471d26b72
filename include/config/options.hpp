// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace synclink {
namespace config {

constexpr uint16_t DEFAULT_QUIC_PORT = 22000;

// Listener-facing options. All fields may change at runtime; consumers
// take a fresh snapshot via ConfigWrapper::GetOptions() on every loop
// iteration.
struct Options {
  // Interval between STUN keepalives, in seconds. < 1 disables discovery.
  int stun_keepalive_s = 24;
  bool nat_enabled = true;
  // Ordered STUN server list ("host:port"). "default" expands to the
  // built-in public server list.
  std::vector<std::string> stun_servers = {"default"};
  std::vector<std::string> listen_addresses = {"quic://0.0.0.0:22000"};
  size_t intake_capacity = 64;

  bool operator==(const Options& other) const = default;
};

// Built-in public STUN servers, used when stun_servers contains "default"
const std::vector<std::string>& DefaultStunServers();

/**
 * ConfigWrapper - thread-safe handle on the current Options
 *
 * Shared between the component that owns configuration (which calls
 * SetOptions() whenever the user edits settings) and the listeners that
 * read it.
 */
class ConfigWrapper {
public:
  ConfigWrapper() = default;
  explicit ConfigWrapper(Options options) : options_(std::move(options)) {}

  ConfigWrapper(const ConfigWrapper&) = delete;
  ConfigWrapper& operator=(const ConfigWrapper&) = delete;

  // Snapshot copy of the current options
  Options GetOptions() const;

  // Replace the options; readers see the change on their next GetOptions()
  void SetOptions(Options options);

  /**
   * Expanded STUN server list
   *
   * "default" entries are replaced in place by DefaultStunServers() in a
   * freshly shuffled order; explicit entries keep their position. Blank
   * entries are dropped.
   */
  std::vector<std::string> StunServers() const;

private:
  mutable std::mutex mutex_;
  Options options_;
};

/**
 * Parse options from a JSON document
 *
 * Expected shape:
 *   {"options": {"stunKeepaliveSeconds": 24, "natEnabled": true,
 *                "stunServers": ["default"], "listenAddresses": [...],
 *                "intakeCapacity": 64}}
 *
 * Missing keys keep their defaults, unknown keys are ignored. Returns
 * std::nullopt (and logs) if a known key has the wrong type.
 */
std::optional<Options> LoadOptionsFromJson(const nlohmann::json& root);

// Read and parse a JSON config file; std::nullopt on I/O or parse failure
std::optional<Options> LoadOptionsFromFile(const std::filesystem::path& path);

// Serialize options back into the same JSON shape
nlohmann::json OptionsToJson(const Options& options);

} // namespace config
} // namespace synclink
