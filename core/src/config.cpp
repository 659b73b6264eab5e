#include "rtk/config.h"

#include "rtk/log.h"

#include <cctype>
#include <fstream>
#include <optional>

#include <nlohmann/json.hpp>

#if RTK_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace rtk {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

std::string trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

struct FileFields {
  std::optional<std::string> user_agent;
  std::optional<int> timeout_seconds;
  std::optional<std::string> vrchat_base_url;
  std::optional<std::string> discord_base_url;
  std::optional<int64_t> discord_max_messages;
  std::optional<int64_t> listing_delay_ms;
  std::optional<int64_t> discord_delay_ms;
  std::optional<int64_t> lookup_delay_ms;
  std::optional<int> retry_attempts;
  std::optional<int64_t> retry_delay_ms;
  std::optional<int> totp_min_remaining;
};

bool apply_file_fields(TrackerConfig& cfg, const FileFields& f, RunError& error) {
  auto negative = [&](const char* key, int64_t value) {
    if (value < 0) {
      set_error(error, ErrorKind::Config, std::string(key) + " must not be negative");
      return true;
    }
    return false;
  };

  if (f.user_agent && !f.user_agent->empty()) cfg.user_agent = *f.user_agent;
  if (f.vrchat_base_url && !f.vrchat_base_url->empty()) cfg.vrchat_base_url = *f.vrchat_base_url;
  if (f.discord_base_url && !f.discord_base_url->empty()) cfg.discord_base_url = *f.discord_base_url;
  if (f.timeout_seconds) {
    if (*f.timeout_seconds <= 0) {
      set_error(error, ErrorKind::Config, "http.timeout_seconds must be positive");
      return false;
    }
    cfg.http_timeout_seconds = *f.timeout_seconds;
  }
  if (f.discord_max_messages) {
    if (negative("discord.max_messages", *f.discord_max_messages)) return false;
    cfg.discord_max_messages = static_cast<size_t>(*f.discord_max_messages);
  }
  if (f.listing_delay_ms) {
    if (negative("pacing.listing_delay_ms", *f.listing_delay_ms)) return false;
    cfg.pacing.listing_delay = std::chrono::milliseconds(*f.listing_delay_ms);
  }
  if (f.discord_delay_ms) {
    if (negative("pacing.discord_delay_ms", *f.discord_delay_ms)) return false;
    cfg.pacing.discord_delay = std::chrono::milliseconds(*f.discord_delay_ms);
  }
  if (f.lookup_delay_ms) {
    if (negative("pacing.lookup_delay_ms", *f.lookup_delay_ms)) return false;
    cfg.pacing.lookup_delay = std::chrono::milliseconds(*f.lookup_delay_ms);
  }
  if (f.retry_attempts) {
    if (*f.retry_attempts < 1) {
      set_error(error, ErrorKind::Config, "retry.attempts must be at least 1");
      return false;
    }
    cfg.retry.attempts = *f.retry_attempts;
  }
  if (f.retry_delay_ms) {
    if (negative("retry.delay_ms", *f.retry_delay_ms)) return false;
    cfg.retry.delay = std::chrono::milliseconds(*f.retry_delay_ms);
  }
  if (f.totp_min_remaining) {
    if (*f.totp_min_remaining < 0 || *f.totp_min_remaining >= 30) {
      set_error(error, ErrorKind::Config, "totp.min_remaining_seconds must be within [0, 30)");
      return false;
    }
    cfg.totp_min_remaining_seconds = *f.totp_min_remaining;
  }
  return true;
}

bool read_json_fields(const std::filesystem::path& path, FileFields& f, RunError& error) {
  std::ifstream in(path);
  if (!in) {
    set_error(error, ErrorKind::Config, "config read failed: " + path.string());
    return false;
  }
  try {
    nlohmann::json j;
    in >> j;
    const auto& root = j.contains("tracker") ? j["tracker"] : j;

    if (root.contains("user_agent")) f.user_agent = root["user_agent"].get<std::string>();
    if (root.contains("http")) {
      const auto& http = root["http"];
      if (http.contains("timeout_seconds")) f.timeout_seconds = http["timeout_seconds"].get<int>();
    }
    if (root.contains("vrchat")) {
      const auto& vrchat = root["vrchat"];
      if (vrchat.contains("base_url")) f.vrchat_base_url = vrchat["base_url"].get<std::string>();
    }
    if (root.contains("discord")) {
      const auto& discord = root["discord"];
      if (discord.contains("base_url")) f.discord_base_url = discord["base_url"].get<std::string>();
      if (discord.contains("max_messages")) f.discord_max_messages = discord["max_messages"].get<int64_t>();
    }
    if (root.contains("pacing")) {
      const auto& pacing = root["pacing"];
      if (pacing.contains("listing_delay_ms")) f.listing_delay_ms = pacing["listing_delay_ms"].get<int64_t>();
      if (pacing.contains("discord_delay_ms")) f.discord_delay_ms = pacing["discord_delay_ms"].get<int64_t>();
      if (pacing.contains("lookup_delay_ms")) f.lookup_delay_ms = pacing["lookup_delay_ms"].get<int64_t>();
    }
    if (root.contains("retry")) {
      const auto& retry = root["retry"];
      if (retry.contains("attempts")) f.retry_attempts = retry["attempts"].get<int>();
      if (retry.contains("delay_ms")) f.retry_delay_ms = retry["delay_ms"].get<int64_t>();
    }
    if (root.contains("totp")) {
      const auto& totp = root["totp"];
      if (totp.contains("min_remaining_seconds")) f.totp_min_remaining = totp["min_remaining_seconds"].get<int>();
    }
  } catch (const nlohmann::json::exception& e) {
    set_error(error, ErrorKind::Config, std::string("config parse failed: ") + e.what());
    return false;
  }
  return true;
}

#if RTK_ENABLE_DATA_YAML
bool read_yaml_fields(const std::filesystem::path& path, FileFields& f, RunError& error) {
  try {
    YAML::Node doc = YAML::LoadFile(path.string());
    YAML::Node root = doc["tracker"] ? doc["tracker"] : doc;

    if (root["user_agent"]) f.user_agent = root["user_agent"].as<std::string>();
    if (root["http"]) {
      auto http = root["http"];
      if (http["timeout_seconds"]) f.timeout_seconds = http["timeout_seconds"].as<int>();
    }
    if (root["vrchat"]) {
      auto vrchat = root["vrchat"];
      if (vrchat["base_url"]) f.vrchat_base_url = vrchat["base_url"].as<std::string>();
    }
    if (root["discord"]) {
      auto discord = root["discord"];
      if (discord["base_url"]) f.discord_base_url = discord["base_url"].as<std::string>();
      if (discord["max_messages"]) f.discord_max_messages = discord["max_messages"].as<int64_t>();
    }
    if (root["pacing"]) {
      auto pacing = root["pacing"];
      if (pacing["listing_delay_ms"]) f.listing_delay_ms = pacing["listing_delay_ms"].as<int64_t>();
      if (pacing["discord_delay_ms"]) f.discord_delay_ms = pacing["discord_delay_ms"].as<int64_t>();
      if (pacing["lookup_delay_ms"]) f.lookup_delay_ms = pacing["lookup_delay_ms"].as<int64_t>();
    }
    if (root["retry"]) {
      auto retry = root["retry"];
      if (retry["attempts"]) f.retry_attempts = retry["attempts"].as<int>();
      if (retry["delay_ms"]) f.retry_delay_ms = retry["delay_ms"].as<int64_t>();
    }
    if (root["totp"]) {
      auto totp = root["totp"];
      if (totp["min_remaining_seconds"]) f.totp_min_remaining = totp["min_remaining_seconds"].as<int>();
    }
  } catch (const YAML::Exception& e) {
    set_error(error, ErrorKind::Config, std::string("config parse failed: ") + e.what());
    return false;
  }
  return true;
}
#endif
} // namespace

std::vector<std::string> split_delimited(const std::string& text, char delimiter) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(delimiter, start);
    if (end == std::string::npos) end = text.size();
    std::string item = trim(text.substr(start, end - start));
    if (!item.empty()) {
      out.push_back(std::move(item));
    }
    start = end + 1;
  }
  return out;
}

bool is_snowflake(const std::string& text) {
  if (text.empty() || text.size() > 20) return false;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  // Must fit an unsigned 64-bit value.
  return text.size() < 20 || text <= "18446744073709551615";
}

bool load_tracker_config(const std::filesystem::path& path, TrackerConfig& cfg, RunError& error) {
  if (!file_exists(path)) {
    set_error(error, ErrorKind::Config, "config not found: " + path.string());
    return false;
  }

  FileFields fields;
  const auto ext = path.extension().string();
  if (ext == ".json") {
    if (!read_json_fields(path, fields, error)) return false;
  } else if (ext == ".yaml" || ext == ".yml") {
#if RTK_ENABLE_DATA_YAML
    if (!read_yaml_fields(path, fields, error)) return false;
#else
    set_error(error, ErrorKind::Config, "YAML config requested but YAML support is disabled");
    return false;
#endif
  } else {
    set_error(error, ErrorKind::Config, "unknown config extension: " + ext);
    return false;
  }

  if (!apply_file_fields(cfg, fields, error)) return false;
  log::info("config loaded: " + path.string());
  return true;
}

bool validate_tracker_config(const TrackerConfig& cfg, RunError& error) {
  if (cfg.workspace.empty()) {
    set_error(error, ErrorKind::Config, "workspace is required");
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(cfg.workspace, ec)) {
    set_error(error, ErrorKind::Config, "workspace not found: " + cfg.workspace.string());
    return false;
  }
  if (cfg.output.empty()) {
    set_error(error, ErrorKind::Config, "output is required");
    return false;
  }
  if (cfg.vrchat.username.empty() || cfg.vrchat.password.empty()) {
    set_error(error, ErrorKind::Config, "VRChat username and password are required");
    return false;
  }
  if (cfg.vrchat.totp_secret.empty()) {
    set_error(error, ErrorKind::Config, "VRChat two-factor key is required");
    return false;
  }
  if (cfg.server_ids.size() != cfg.channel_ids.size()) {
    set_error(error, ErrorKind::Config,
              "Discord servers (" + std::to_string(cfg.server_ids.size()) + ") and channels (" +
                  std::to_string(cfg.channel_ids.size()) + ") must have the same length");
    return false;
  }
  for (const auto* ids : {&cfg.server_ids, &cfg.channel_ids}) {
    for (const auto& id : *ids) {
      if (!is_snowflake(id)) {
        set_error(error, ErrorKind::Config, "not a Discord id: " + id);
        return false;
      }
    }
  }
  return true;
}

} // namespace rtk
