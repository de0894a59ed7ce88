#pragma once

#include <string>

namespace asmhom {

// A uniquely named directory that is removed, with its contents, when the
// object is destroyed or remove() is called.
class ScopedTempDir {
public:
    ScopedTempDir() = default;
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

    // Create <root>/<prefix>XXXXXX. root is created if missing.
    // Returns false and sets error_msg on failure.
    bool create(const std::string& root, const std::string& prefix,
                std::string& error_msg);

    // Remove the directory now. Safe to call more than once.
    void remove();

    const std::string& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

private:
    std::string path_;
};

// Default root for temporary directories ($TMPDIR or /tmp).
std::string default_temp_root();

} // namespace asmhom
