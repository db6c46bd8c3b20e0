#include "util/which.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "util/file.hpp"

namespace {
absl::Mutex cache_mutex;
using Cache = std::unordered_map<std::string, std::string>;
Cache* cmd_cache ABSL_GUARDED_BY(cache_mutex) = new Cache;
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return File::Exists(cmd) ? cmd : "";
  }
  if (use_cache) {
    absl::MutexLock lck(&cache_mutex);
    auto it = cmd_cache->find(cmd);
    if (it != cmd_cache->end() && !it->second.empty()) return it->second;
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());

  std::string found;
  for (const std::string& dir : dirs) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (File::Exists(fullpath)) {
      found = fullpath;
      break;
    }
  }
  absl::MutexLock lck(&cache_mutex);
  (*cmd_cache)[cmd] = found;
  return found;
}

}  // namespace util
