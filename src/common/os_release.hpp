#pragma once

#include <map>
#include <optional>
#include <string>

#include <QString>

namespace pkgsnap {

using OsReleaseFields = std::map<std::string, std::string>;

// Parse os-release(5) content: KEY=value lines, values optionally single or
// double quoted, comments and blank lines ignored.
OsReleaseFields parseOsRelease(const QString &content);

// Read and parse the file; std::nullopt when it cannot be read.
std::optional<OsReleaseFields> readOsRelease(const QString &path);

} // namespace pkgsnap
