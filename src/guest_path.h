#pragma once

#include <string>

namespace malsand {

// Guest paths are always POSIX, whatever the host uses. Every path that
// reaches the hypervisor goes through these helpers.
namespace guest_path {

// Backslashes to slashes, duplicate slashes collapsed, trailing slash dropped
std::string normalize(const std::string& path);

// normalize() plus validation: must be absolute with no "." or ".."
// segments. Throws TransferError(INVALID_PATH).
std::string require_absolute(const std::string& path);

std::string join(const std::string& dir, const std::string& name);

std::string basename(const std::string& path);
std::string dirname(const std::string& path);

// Strip to a file name safe to embed in guest command lines:
// [A-Za-z0-9._-], anything else becomes '_'
std::string sanitize_filename(const std::string& filename);

// File name without its last extension ("hello.c" -> "hello")
std::string stem(const std::string& filename);

} // namespace guest_path
} // namespace malsand
