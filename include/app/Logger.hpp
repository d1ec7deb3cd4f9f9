#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

namespace sysmaint::app {

// Destination for finished log lines.
class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void append_line(const std::string& line) = 0;
};

// Echo to stdout and append to a file, flushing after every line.
class FileLogSink final : public LogSink {
public:
  // Throws std::runtime_error if the file cannot be opened for append.
  explicit FileLogSink(std::filesystem::path path, bool echo_stdout = true);
  FileLogSink(const FileLogSink&) = delete;
  FileLogSink& operator=(const FileLogSink&) = delete;

  void append_line(const std::string& line) override;
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::ofstream file_;
  bool echo_stdout_;
};

// Keeps lines in memory.
class MemoryLogSink final : public LogSink {
public:
  void append_line(const std::string& line) override { lines_.push_back(line); }
  [[nodiscard]] const std::vector<std::string>& lines() const { return lines_; }
  void clear() { lines_.clear(); }
private:
  std::vector<std::string> lines_;
};

// Formats "<YYYY-MM-DD HH:MM:SS> - <message>" and hands it to the sink.
class Logger {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit Logger(LogSink& sink, Clock clock = {});

  void log(const std::string& message);

private:
  LogSink& sink_;
  Clock clock_;
};

// Message part of a formatted line (text after the first " - ").
[[nodiscard]] std::string message_of(const std::string& line);

} // namespace sysmaint::app
