#pragma once

#include <optional>

#include <QByteArray>

namespace pkgsnap {

// Compress data into a single gzip member (RFC 1952). Throws
// std::runtime_error if zlib reports a failure.
QByteArray gzipCompress(const QByteArray &data);

// Decompress a complete gzip stream. Returns std::nullopt for corrupt or
// truncated input.
std::optional<QByteArray> gzipDecompress(const QByteArray &data);

} // namespace pkgsnap
