#include "util/Command.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace sysmaint::util {

auto run_command(const std::string& cmd) -> std::optional<CommandResult> {
  std::string full = "(" + cmd + ") 2>&1";
  FILE* fp = ::popen(full.c_str(), "r");
  if (!fp) return std::nullopt;
  CommandResult r;
  char buf[512];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) r.output.append(buf, n);
  int status = ::pclose(fp);
  if (status != -1 && WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
  while (!r.output.empty() && (r.output.back()=='\n' || r.output.back()=='\r' || r.output.back()==' ' || r.output.back()=='\t'))
    r.output.pop_back();
  return r;
}

auto find_in_path(const std::string& name) -> std::string {
  if (const char* path = std::getenv("PATH")) {
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/" + name;
        if (::access(cand.c_str(), X_OK) == 0) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  return std::string();
}

auto shell_quote(const std::string& s) -> std::string {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

} // namespace sysmaint::util
