#include "cpupool/util/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

namespace cpupool {
namespace util {

Config::Config() : maxWorkers(defaultMaxWorkers()) {}

std::size_t Config::defaultMaxWorkers() {
  const unsigned hc = std::thread::hardware_concurrency();
  if (hc <= 1) return 1;
  return static_cast<std::size_t>(hc - 1);
}

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::parseBool(const std::string& s, bool fallback) {
  std::string x = s;
  std::transform(x.begin(), x.end(), x.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (x == "1" || x == "true" || x == "yes" || x == "on")  return true;
  if (x == "0" || x == "false" || x == "no" || x == "off") return false;
  return fallback;
}

long Config::parseMs(const std::string& s, long lo) {
  return std::min(kMaxDurationMs, std::max(lo, std::atol(s.c_str())));
}

bool Config::apply(const std::string& key, const std::string& val) {
  if      (key == "maxWorkers")            maxWorkers            = static_cast<std::size_t>(std::max(1L, std::atol(val.c_str())));
  else if (key == "taskTimeoutMs")         taskTimeoutMs         = parseMs(val, 1);
  else if (key == "idleTimeoutMs")         idleTimeoutMs         = parseMs(val, 1);
  else if (key == "retryAttempts")         retryAttempts         = std::max(0, std::atoi(val.c_str()));
  else if (key == "enableMetrics")         enableMetrics         = parseBool(val, enableMetrics);
  else if (key == "metricsIntervalMs")     metricsIntervalMs     = parseMs(val, 1);
  else if (key == "shutdownGracePeriodMs") shutdownGracePeriodMs = parseMs(val, 0);
  else if (key == "logLevel")              logLevel              = val;
  else if (key == "logFormat")             logFormat             = val;
  else if (key == "logFile")               logFile               = val;
  else return false;
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // Simple INI-ish parser: key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so new knobs don't break older builds.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;
    apply(key, val);
  }

  std::fclose(f);
  return true;
}

} // namespace util
} // namespace cpupool
