#include "cpupool/handlers/Builtins.hpp"

#include "cpupool/Task.hpp"
#include "cpupool/util/Sha256.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <boost/regex.hpp>

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace cpupool {
namespace handlers {

namespace {

rapidjson::Document parsePayload(const std::string& payload, const char* what) {
  rapidjson::Document doc;
  doc.Parse(payload.c_str());
  if (doc.HasParseError()) {
    throw std::runtime_error(std::string(what) + ": malformed payload: " +
                             rapidjson::GetParseError_En(doc.GetParseError()));
  }
  if (!doc.IsObject()) throw std::runtime_error(std::string(what) + ": payload must be a JSON object");
  return doc;
}

std::string needString(const rapidjson::Value& v, const char* k, const char* what) {
  if (!v.HasMember(k) || !v[k].IsString())
    throw std::runtime_error(std::string(what) + ": missing string '" + k + "'");
  return v[k].GetString();
}

inline bool boolOr(const rapidjson::Value& v, const char* k, bool def) {
  return (v.HasMember(k) && v[k].IsBool()) ? v[k].GetBool() : def;
}

inline int intOr(const rapidjson::Value& v, const char* k, int def) {
  return (v.HasMember(k) && v[k].IsInt()) ? v[k].GetInt() : def;
}

std::string readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) throw std::runtime_error("Read error: " + path);
  return data;
}

std::vector<std::string> splitLines(const std::string& s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (;;) {
    const auto nl = s.find('\n', start);
    if (nl == std::string::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, nl - start));
    start = nl + 1;
  }
}

std::string trim(const std::string& s) {
  auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
  auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c){ return std::isspace(c); }).base();
  return b < e ? std::string(b, e) : std::string();
}

// Boost's matcher keeps its backtracking state on the heap and throws
// (std::runtime_error) when a match gets too expensive, so one long line
// fails the task instead of overflowing the worker's stack.
std::size_t countMatches(const std::string& s, const boost::regex& re) {
  return static_cast<std::size_t>(std::distance(boost::sregex_iterator(s.begin(), s.end(), re),
                                                boost::sregex_iterator()));
}

struct GzipTotals {
  std::uint64_t in  = 0;
  std::uint64_t out = 0;
};

// Streams `in` through deflate into `out` in fixed-size chunks, so neither
// side has to fit in memory or in zlib's 32-bit avail_* counters.
GzipTotals gzipStream(std::istream& in, std::ostream& out, int level) {
  z_stream zs{};
  // windowBits 15 + 16 selects the gzip wrapper.
  if (deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK)
    throw std::runtime_error("deflateInit2 failed");
  struct End { z_stream& zs; ~End() { deflateEnd(&zs); } } end{zs};

  constexpr std::size_t kChunk = 256 * 1024;
  std::vector<char> inBuf(kChunk);
  std::vector<char> outBuf(kChunk);
  GzipTotals totals;

  int flush = Z_NO_FLUSH;
  int rc = Z_OK;
  do {
    in.read(inBuf.data(), static_cast<std::streamsize>(inBuf.size()));
    if (in.bad()) throw std::runtime_error("Read error during compression");
    const auto n = static_cast<std::size_t>(in.gcount());
    totals.in += n;
    flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;
    zs.next_in  = reinterpret_cast<Bytef*>(inBuf.data());
    zs.avail_in = static_cast<uInt>(n);

    do {
      zs.next_out  = reinterpret_cast<Bytef*>(outBuf.data());
      zs.avail_out = static_cast<uInt>(outBuf.size());
      rc = deflate(&zs, flush);
      if (rc == Z_STREAM_ERROR) throw std::runtime_error("gzip compression failed");
      const std::size_t have = outBuf.size() - zs.avail_out;
      out.write(outBuf.data(), static_cast<std::streamsize>(have));
      if (!out) throw std::runtime_error("Write error during compression");
      totals.out += have;
    } while (zs.avail_out == 0);
  } while (flush != Z_FINISH);

  if (rc != Z_STREAM_END) throw std::runtime_error("gzip compression failed");
  return totals;
}

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

} // namespace

std::string hashFile(const std::string& payload) {
  const auto doc  = parsePayload(payload, "hash_file");
  const auto path = needString(doc, "path", "hash_file");

  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open file: " + path);

  util::Sha256 sha;
  std::vector<char> chunk(64 * 1024);
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto n = in.gcount();
    if (n > 0) sha.update(chunk.data(), static_cast<std::size_t>(n));
  }
  if (in.bad()) throw std::runtime_error("Read error: " + path);

  rapidjson::StringBuffer sb;
  Writer w(sb);
  w.StartObject();
  w.Key("path"); w.String(path.c_str(), static_cast<rapidjson::SizeType>(path.size()));
  w.Key("hash"); w.String(util::Sha256::toHex(sha.finish()).c_str());
  w.EndObject();
  return sb.GetString();
}

std::string compressFile(const std::string& payload) {
  const auto doc       = parsePayload(payload, "compress_file");
  const auto filePath  = needString(doc, "filePath", "compress_file");
  const auto outputDir = needString(doc, "outputDir", "compress_file");
  const int  level     = intOr(doc, "compressionLevel", 6);
  if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION)
    throw std::runtime_error("compress_file: compressionLevel must be -1..9");

  std::ifstream in(filePath, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open file: " + filePath);

  const fs::path outPath = fs::path(outputDir) / (fs::path(filePath).filename().string() + ".gz");
  std::error_code ec;
  fs::create_directories(outPath.parent_path(), ec);
  if (ec) throw std::runtime_error("Cannot create directory " + outputDir + ": " + ec.message());

  GzipTotals totals;
  {
    std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write file: " + outPath.string());
    try {
      totals = gzipStream(in, out, level);
      out.close();
      if (!out) throw std::runtime_error("Write error: " + outPath.string());
    } catch (const std::exception&) {
      out.close();
      fs::remove(outPath, ec);   // no truncated archive left behind
      throw;
    }
  }

  const double ratio = totals.out == 0 ? 0.0
                                       : static_cast<double>(totals.in) / static_cast<double>(totals.out);

  rapidjson::StringBuffer sb;
  Writer w(sb);
  w.StartObject();
  w.Key("input");  w.String(filePath.c_str());
  w.Key("output"); w.String(outPath.string().c_str());
  w.Key("ratio");  w.Double(ratio);
  w.EndObject();
  return sb.GetString();
}

std::string analyzeCode(const std::string& payload) {
  static const boost::regex functionRe(R"(function\s+\w+)");
  static const boost::regex classRe(R"(class\s+\w+)");
  static const boost::regex importRe(R"(import\s+.*from)");
  static const boost::regex exportRe(R"(export\s+)");

  const auto doc  = parsePayload(payload, "analyze_code");
  const auto path = needString(doc, "path", "analyze_code");
  const std::string content = readFile(path);

  const auto lines = splitLines(content);
  const auto nonEmpty = std::count_if(lines.begin(), lines.end(),
                                      [](const std::string& l){ return !trim(l).empty(); });

  rapidjson::StringBuffer sb;
  Writer w(sb);
  w.StartObject();
  w.Key("file");          w.String(path.c_str());
  w.Key("lines");         w.Uint64(lines.size());
  w.Key("nonEmptyLines"); w.Uint64(static_cast<std::uint64_t>(nonEmpty));
  w.Key("functions");     w.Uint64(countMatches(content, functionRe));
  w.Key("classes");       w.Uint64(countMatches(content, classRe));
  w.Key("imports");       w.Uint64(countMatches(content, importRe));
  w.Key("exports");       w.Uint64(countMatches(content, exportRe));
  w.EndObject();
  return sb.GetString();
}

std::string searchInFile(const std::string& payload) {
  const auto doc      = parsePayload(payload, "search_in_file");
  const auto filePath = needString(doc, "filePath", "search_in_file");
  const auto pattern  = needString(doc, "pattern", "search_in_file");
  const bool caseSensitive = boolOr(doc, "caseSensitive", false);

  boost::regex re;
  try {
    boost::regex::flag_type flags = boost::regex::ECMAScript;
    if (!caseSensitive) flags |= boost::regex::icase;
    re.assign(pattern, flags);
  } catch (const boost::regex_error& ex) {
    throw std::runtime_error("search_in_file: invalid pattern '" + pattern + "': " + ex.what());
  }

  const std::string content = readFile(filePath);
  const auto lines = splitLines(content);

  rapidjson::StringBuffer sb;
  Writer w(sb);
  w.StartObject();
  w.Key("file"); w.String(filePath.c_str());
  w.Key("matches");
  w.StartArray();
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto& line = lines[i];
    std::string context;
    for (auto it = boost::sregex_iterator(line.begin(), line.end(), re); it != boost::sregex_iterator(); ++it) {
      if (context.empty()) context = trim(line);
      const std::string text = it->str();
      w.StartObject();
      w.Key("line");    w.Uint64(i + 1);
      w.Key("column");  w.Uint64(static_cast<std::uint64_t>(it->position()));
      w.Key("text");    w.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
      w.Key("context"); w.String(context.c_str(), static_cast<rapidjson::SizeType>(context.size()));
      w.EndObject();
    }
  }
  w.EndArray();
  w.EndObject();
  return sb.GetString();
}

void registerBuiltinHandlers(HandlerRegistry& registry) {
  registry.registerHandler(task_types::HashFile,     &hashFile);
  registry.registerHandler(task_types::CompressFile, &compressFile);
  registry.registerHandler(task_types::AnalyzeCode,  &analyzeCode);
  registry.registerHandler(task_types::SearchInFile, &searchInFile);
}

} // namespace handlers
} // namespace cpupool
