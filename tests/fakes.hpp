#pragma once
// Test doubles for the host collaborators.
#include "collectors/IResourceProbe.hpp"
#include "host/IServiceControl.hpp"
#include "host/IUpdateControl.hpp"

#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace fakes {

class FixedProbe final : public sysmaint::collectors::IResourceProbe {
public:
  explicit FixedProbe(sysmaint::model::ResourceSnapshot s) : s_(s) {}
  sysmaint::model::ResourceSnapshot sample() override { ++calls; return s_; }
  int calls{0};
private:
  sysmaint::model::ResourceSnapshot s_;
};

// Services in `running` are up; start() succeeds unless the name is in
// `broken`, and a started service counts as running afterwards.
class FakeServices final : public sysmaint::host::IServiceControl {
public:
  std::set<std::string> running;
  std::set<std::string> broken;
  std::vector<std::string> queried;
  std::vector<std::string> started;

  bool is_running(const std::string& name) override {
    queried.push_back(name);
    return running.count(name) != 0;
  }
  void start(const std::string& name) override {
    started.push_back(name);
    if (broken.count(name)) throw std::runtime_error("unit " + name + " failed to start");
    running.insert(name);
  }
};

class FakeUpdates final : public sysmaint::host::IUpdateControl {
public:
  bool elevated{false};
  bool fail{false};
  int installs{0};

  bool is_elevated() const override { return elevated; }
  void install_updates() override {
    ++installs;
    if (fail) throw std::runtime_error("mirror unreachable");
  }
};

// Fresh scratch directory under the system temp dir.
inline std::filesystem::path scratch_dir(const std::string& suffix) {
  auto dir = std::filesystem::temp_directory_path() /
             ("sysmaint_test_" + suffix + "_" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

} // namespace fakes
