#include <public/atomic_file.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

#include <boost/filesystem.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = boost::filesystem;

namespace basil {

namespace {

std::atomic<unsigned long> g_temp_counter{0};

std::string errno_message(const std::string &what, const fs::path &path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

// One attempt; returns an error description or an empty string.
std::string try_write(const fs::path &target, const std::string &content) {
  try {
    if (target.has_parent_path()) {
      fs::create_directories(target.parent_path());
    }
  } catch (const fs::filesystem_error &e) {
    return std::string("cannot create directory: ") + e.what();
  }

  std::ostringstream name;
  name << target.filename().string() << ".tmp." << ::getpid() << "."
       << g_temp_counter++;
  const fs::path temp = target.parent_path() / name.str();

  int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd == -1) {
    return errno_message("cannot open", temp);
  }

  const char *data = content.data();
  size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, data, remaining);
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      std::string error = errno_message("cannot write", temp);
      ::close(fd);
      ::unlink(temp.c_str());
      return error;
    }
    data += n;
    remaining -= static_cast<size_t>(n);
  }
  if (::fsync(fd) == -1) {
    std::string error = errno_message("cannot fsync", temp);
    ::close(fd);
    ::unlink(temp.c_str());
    return error;
  }
  if (::close(fd) == -1) {
    std::string error = errno_message("cannot close", temp);
    ::unlink(temp.c_str());
    return error;
  }
  if (::rename(temp.c_str(), target.c_str()) == -1) {
    std::string error = errno_message("cannot rename onto", target);
    ::unlink(temp.c_str());
    return error;
  }
  return std::string();
}

} // namespace

void write_file_atomic(const fs::path &target, const std::string &content) {
  std::string error = try_write(target, content);
  if (error.empty()) {
    return;
  }
  get_logger("store")->warn("Atomic write of {} failed ({}), retrying",
                            target.string(), error);
  error = try_write(target, content);
  if (!error.empty()) {
    get_logger("store")->error("Atomic write of {} failed again: {}",
                               target.string(), error);
    throw StorageError("Failed to write " + target.string() + ": " + error);
  }
}

std::string read_file(const fs::path &path) {
  std::ifstream in(path.string(), std::ios::binary);
  if (!in.is_open()) {
    throw StorageError("Cannot open " + path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    throw StorageError("Cannot read " + path.string());
  }
  return ss.str();
}

} // namespace basil
