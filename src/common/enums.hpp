#pragma once

namespace pkgsnap {

enum class PackageManagerKind {
    Apt,
    Yum,
    Pacman,
    Zypper,
    Unknown
};

enum class OutputFormat {
    Text,
    Json
};

} // namespace pkgsnap
