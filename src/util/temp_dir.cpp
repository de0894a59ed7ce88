#include "util/temp_dir.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace asmhom {

ScopedTempDir::~ScopedTempDir() {
    remove();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

bool ScopedTempDir::create(const std::string& root, const std::string& prefix,
                           std::string& error_msg) {
    remove();

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        error_msg = "cannot create temp root " + root + ": " + ec.message();
        return false;
    }

    std::string templ = root + "/" + prefix + "XXXXXX";
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        error_msg = "mkdtemp failed for " + templ + ": " + std::strerror(errno);
        return false;
    }
    path_ = buf.data();
    return true;
}

void ScopedTempDir::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

std::string default_temp_root() {
    const char* env = std::getenv("TMPDIR");
    if (env && *env) return env;
    return "/tmp";
}

} // namespace asmhom
