#ifndef BUILD_INFO_HPP
#define BUILD_INFO_HPP

#include <string>

#ifndef SCRIBE_VERSION
#define SCRIBE_VERSION "0.0.0-dev"
#endif

class BuildInfo {
private:
  std::string version_ = SCRIBE_VERSION;

  BuildInfo() {}

public:
  BuildInfo(const BuildInfo &) = delete;
  BuildInfo &operator=(const BuildInfo &) = delete;

  static BuildInfo &getInstance() {
    static BuildInfo instance;
    return instance;
  }

  std::string describe() const {
    return "scribe " + version_ + " (built " __DATE__ ")";
  }
};

#endif
