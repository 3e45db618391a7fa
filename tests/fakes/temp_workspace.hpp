#pragma once
/** @file  temp_workspace.hpp
 *  @brief Scratch workspace directory removed when the test ends.
 */

#include <boost/filesystem.hpp>

namespace basil {
namespace test {

class TempWorkspace {
public:
  TempWorkspace()
      : _path(boost::filesystem::temp_directory_path() /
              boost::filesystem::unique_path("basil-test-%%%%-%%%%-%%%%")) {
    boost::filesystem::create_directories(_path);
  }

  ~TempWorkspace() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(_path, ec);
  }

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  const boost::filesystem::path &path() const { return _path; }

private:
  boost::filesystem::path _path;
};

} // namespace test
} // namespace basil
