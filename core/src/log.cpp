#include "rtk/log.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace rtk::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "rtk";
std::vector<std::string> g_secrets;

std::string format_now(const char* pattern) {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

// Caller holds g_log_mutex.
std::string redact(std::string text) {
  for (const auto& secret : g_secrets) {
    size_t pos = 0;
    while ((pos = text.find(secret, pos)) != std::string::npos) {
      text.replace(pos, secret.size(), "***");
      pos += 3;
    }
  }
  return text;
}

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + level + "] " + redact(std::string(msg));
  std::cout << line << "\n";
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init() {
  init("rtk", std::filesystem::current_path() / "logs");
}

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  g_app_name = app_name;
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  if (!ec) {
    const std::string file_name = g_app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log";
    g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
  }
  log_line("INFO", "log init");
  if (ec || !g_log_file.is_open()) {
    log_line("WARN", std::string("log file unavailable: ") + log_dir.string());
  }
#ifdef RTK_DEBUG
  log_line("INFO", "build: debug");
#else
  log_line("INFO", "build: release");
#endif
#ifdef RTK_GIT_HASH
  log_line("INFO", std::string("git: ") + RTK_GIT_HASH);
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void add_secret(std::string_view secret) {
  if (secret.empty()) return;
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_secrets.emplace_back(secret);
}

void info(std::string_view msg) {
  log_line("INFO", msg);
}

void warn(std::string_view msg) {
  log_line("WARN", msg);
}

void error(std::string_view msg) {
  log_line("ERROR", msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - count, g_ring.end());
}

namespace {
void crash_handler(int sig) {
  log_line("ERROR", std::string("crash signal: ") + std::to_string(sig));
  std::_Exit(1);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, crash_handler);
  std::signal(SIGABRT, crash_handler);
  std::signal(SIGFPE, crash_handler);
  std::signal(SIGILL, crash_handler);
}

} // namespace rtk::log
