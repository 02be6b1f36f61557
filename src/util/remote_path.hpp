#pragma once

#include <string>
#include <initializer_list>

// Helpers for remote (WebDAV) paths. Remote paths always use '/'.
namespace RemotePath {

// Join segments with '/', turning '\' into '/', collapsing repeated slashes,
// dropping "." and resolving "..". Leading '/' kept iff the first non-empty
// segment had one. No trailing slash.
std::string join(std::initializer_list<std::string> segments);

// Everything before the last '/', or "" when there is none.
std::string parent(const std::string& path);

// Last segment, ignoring a trailing '/'.
std::string basename(const std::string& path);

// Memo key for a directory: repeated slashes collapsed, leading and
// trailing slashes removed.
std::string directory_key(const std::string& path);

// URL form: one leading '/' stripped, each segment percent-encoded.
std::string encode(const std::string& path);

} // namespace RemotePath
