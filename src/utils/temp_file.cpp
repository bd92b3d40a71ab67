#include "utils/temp_file.hpp"
#include <cerrno>
#include <system_error>
#include <vector>
#include <stdlib.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace hvault {
namespace utils {

namespace {

// Closes the descriptor on every exit path
struct FileDescriptor {
  int fd = -1;

  explicit FileDescriptor(int descriptor) : fd(descriptor) {}
  ~FileDescriptor() {
    if (fd >= 0) {
      ::close(fd);
    }
  }

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
};

} // namespace

std::filesystem::path write_temp_file(const std::string& dir, const std::string& prefix,
                                      const std::string& content) {
  const std::filesystem::path directory = dir.empty()
    ? std::filesystem::temp_directory_path()
    : std::filesystem::path(dir);

  std::string pattern = (directory / (prefix + "XXXXXX")).string();
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');

  FileDescriptor file(::mkstemp(name.data()));
  if (file.fd < 0) {
    const int error = errno;
    BOOST_LOG_TRIVIAL(error) << "Temp file: Failed to create file in " << directory.string();
    throw std::system_error(error, std::generic_category(), "mkstemp " + pattern);
  }
  const std::filesystem::path path(name.data());

  const char* data = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t written = ::write(file.fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int error = errno;
      ::unlink(name.data());
      BOOST_LOG_TRIVIAL(error) << "Temp file: Failed to write " << path.string();
      throw std::system_error(error, std::generic_category(), "write " + path.string());
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }

  BOOST_LOG_TRIVIAL(trace) << "Temp file: Wrote " << content.size() << " bytes to " << path.string();
  return path;
}

} // namespace utils
} // namespace hvault
