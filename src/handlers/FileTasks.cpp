#include "cpupool/handlers/FileTasks.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace cpupool {
namespace handlers {

namespace {

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

void putString(Writer& w, const char* key, const std::string& v) {
  w.Key(key);
  w.String(v.c_str(), static_cast<rapidjson::SizeType>(v.size()));
}

std::string pathPayload(const std::string& path) {
  rapidjson::StringBuffer sb;
  Writer w(sb);
  w.StartObject();
  putString(w, "path", path);
  w.EndObject();
  return sb.GetString();
}

} // namespace

std::vector<std::string> FileTasks::hashFiles(const std::vector<std::string>& paths) {
  return pool_.parallelMap(paths, task_types::HashFile, &pathPayload);
}

std::vector<std::string> FileTasks::compressFiles(const std::vector<std::string>& paths,
                                                  const std::string& outputDir,
                                                  int compressionLevel) {
  return pool_.parallelMap(paths, task_types::CompressFile, [&](const std::string& p) {
    rapidjson::StringBuffer sb;
    Writer w(sb);
    w.StartObject();
    putString(w, "filePath", p);
    putString(w, "outputDir", outputDir);
    w.Key("compressionLevel"); w.Int(compressionLevel);
    w.EndObject();
    return std::string(sb.GetString());
  });
}

std::vector<std::string> FileTasks::analyzeCodeFiles(const std::vector<std::string>& paths) {
  return pool_.parallelMap(paths, task_types::AnalyzeCode, &pathPayload);
}

std::vector<std::string> FileTasks::searchInFiles(const std::vector<std::string>& paths,
                                                  const std::string& pattern,
                                                  bool caseSensitive) {
  return pool_.parallelMap(paths, task_types::SearchInFile, [&](const std::string& p) {
    rapidjson::StringBuffer sb;
    Writer w(sb);
    w.StartObject();
    putString(w, "filePath", p);
    putString(w, "pattern", pattern);
    w.Key("caseSensitive"); w.Bool(caseSensitive);
    w.EndObject();
    return std::string(sb.GetString());
  });
}

} // namespace handlers
} // namespace cpupool
