#ifndef warden_SECURITY_GLOB_HPP
#define warden_SECURITY_GLOB_HPP

#include <string>

namespace warden {

// Glob match over '/'-separated paths.
//   *   any run of characters except '/'
//   **  any run of characters including '/'; "a/**" also matches "a",
//       and "**/" may match zero directories
//   ?   one character other than '/'
bool glob_match(const std::string& pattern, const std::string& path);

} // namespace warden

#endif // warden_SECURITY_GLOB_HPP
