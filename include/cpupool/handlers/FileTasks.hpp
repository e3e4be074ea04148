#pragma once

#include <string>
#include <vector>

#include "cpupool/TaskPool.hpp"

namespace cpupool {
namespace handlers {

// Fan a list of files out over a pool with one of the built-in task types.
// Each returns the handlers' JSON results in input order and throws TaskError
// on the first failing file.
class FileTasks {
public:
  explicit FileTasks(TaskPool& pool) : pool_(pool) {}

  std::vector<std::string> hashFiles(const std::vector<std::string>& paths);

  std::vector<std::string> compressFiles(const std::vector<std::string>& paths,
                                         const std::string& outputDir,
                                         int compressionLevel = 6);

  std::vector<std::string> analyzeCodeFiles(const std::vector<std::string>& paths);

  std::vector<std::string> searchInFiles(const std::vector<std::string>& paths,
                                         const std::string& pattern,
                                         bool caseSensitive = false);

private:
  TaskPool& pool_;
};

} // namespace handlers
} // namespace cpupool
