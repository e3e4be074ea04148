#pragma once

#include <string>

#include "cpupool/HandlerRegistry.hpp"

namespace cpupool {
namespace handlers {

// File-oriented CPU work. Each takes and returns JSON text and throws
// std::runtime_error on malformed payloads or I/O failures.

// {"path"} -> {"path","hash"}; SHA-256 of the file contents, lowercase hex.
std::string hashFile(const std::string& payload);

// {"filePath","outputDir","compressionLevel"} -> {"input","output","ratio"}.
// Writes <outputDir>/<basename>.gz, creating outputDir if needed.
std::string compressFile(const std::string& payload);

// {"path"} -> {"file","lines","nonEmptyLines","functions","classes","imports","exports"}
std::string analyzeCode(const std::string& payload);

// {"filePath","pattern","caseSensitive"} -> {"file","matches":[{"line","column","text","context"}]}
// `line` is 1-based, `column` is the 0-based byte offset within the line.
std::string searchInFile(const std::string& payload);

// Registers the four handlers above under their task_types names.
void registerBuiltinHandlers(HandlerRegistry& registry);

} // namespace handlers
} // namespace cpupool
