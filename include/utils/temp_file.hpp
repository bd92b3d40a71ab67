#ifndef HVAULT_UTILS_TEMP_FILE_HPP
#define HVAULT_UTILS_TEMP_FILE_HPP

#include <filesystem>
#include <string>

namespace hvault {
namespace utils {

// Creates a new, uniquely named file (mkstemp) inside dir, or the system
// temporary directory when dir is empty, and writes content to it.
// Throws std::system_error when the file cannot be created or written.
std::filesystem::path write_temp_file(const std::string& dir, const std::string& prefix,
                                      const std::string& content);

} // namespace utils
} // namespace hvault

#endif // HVAULT_UTILS_TEMP_FILE_HPP
