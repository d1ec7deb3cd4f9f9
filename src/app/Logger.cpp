#include "app/Logger.hpp"
#include "util/Format.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace sysmaint::app {

FileLogSink::FileLogSink(std::filesystem::path path, bool echo_stdout)
    : path_(std::move(path)), echo_stdout_(echo_stdout) {
  file_.open(path_, std::ios::app);
  if (!file_) {
    throw std::runtime_error("cannot open log file " + path_.string() + ": " + std::strerror(errno));
  }
}

void FileLogSink::append_line(const std::string& line) {
  if (echo_stdout_) {
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
  }
  file_.write(line.data(), static_cast<std::streamsize>(line.size()));
  file_.put('\n');
  file_.flush();
  if (!file_) throw std::runtime_error("write to " + path_.string() + " failed");
}

Logger::Logger(LogSink& sink, Clock clock)
    : sink_(sink), clock_(std::move(clock)) {
  if (!clock_) clock_ = []{ return std::chrono::system_clock::now(); };
}

void Logger::log(const std::string& message) {
  sink_.append_line(sysmaint::util::format_timestamp(clock_()) + " - " + message);
}

std::string message_of(const std::string& line) {
  auto pos = line.find(" - ");
  if (pos == std::string::npos) return line;
  return line.substr(pos + 3);
}

} // namespace sysmaint::app
