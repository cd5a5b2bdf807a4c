/*
 * warden C++17 - Test helpers
 *
 * Private temporary trees for tests that touch the filesystem.
 */
#ifndef warden_TESTS_TEST_UTIL_HPP
#define warden_TESTS_TEST_UTIL_HPP

#include <warden/security/security_config.hpp>

#include <string>

namespace warden {
namespace test {

// mkdtemp directory, removed with everything beneath it on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string sub(const std::string& relative) const;

private:
    std::string path_;
};

// Configuration rooted in dir:
//   <dir>/framework  framework root
//   <dir>/home       warden home (security/ lives here)
//   <dir>/sandbox    single sandbox root
SecurityConfig make_security_config(const TempDir& dir);

// Write a file, creating parent directories
bool touch(const std::string& path, const std::string& content = "x\n");

} // namespace test
} // namespace warden

#endif // warden_TESTS_TEST_UTIL_HPP
