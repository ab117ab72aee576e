#pragma once

#include <QString>

#include "common/enums.hpp"

namespace pkgsnap {

/**
 * Re-read a written snapshot through the declared pipeline.
 *
 * True only if the file exists and is readable, decompresses completely when
 * compressed is set, and is well-formed for its format: a JSON object with a
 * non-empty "packages" object, or non-empty text. Never throws.
 */
bool validateSnapshotFile(const QString &path, OutputFormat format, bool compressed);

} // namespace pkgsnap
