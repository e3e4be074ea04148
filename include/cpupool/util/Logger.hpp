#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace cpupool {
namespace util {

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4
};

struct Field {
  std::string k;
  std::string v;
};

LogLevel parseLevel(const std::string& s);
const char* levelName(LogLevel lvl);

class Logger {
public:
  Logger();
  ~Logger();

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel lvl);
  void setFormatJson(bool json);
  // Empty path -> stdout. Returns false (and keeps stdout) if the file cannot be opened.
  bool setFile(const std::string& path);

  LogLevel level() const;
  bool enabled(LogLevel lvl) const;

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

  // Thread-local context helper: fields stay attached to every line logged
  // from this thread until the Scoped object goes away.
  class Scoped {
  public:
    explicit Scoped(const std::vector<Field>& add);
    ~Scoped();

    Scoped(const Scoped&)            = delete;
    Scoped& operator=(const Scoped&) = delete;

  private:
    std::vector<Field> previous_;
    std::vector<std::string> added_;
  };

private:
  void writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields);

private:
  mutable std::mutex mx_;
  void* file_ = nullptr;            // FILE* stored as void* to avoid <cstdio> in header
  LogLevel lvl_ = LogLevel::Info;
  bool json_ = false;
};

Logger& logger();

} // namespace util
} // namespace cpupool
