#pragma once

/**
 * @file version.hpp
 * @brief jnorm version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace jnorm {

/// jnorm version string
constexpr const char* kVersion = "1.1.2";

/// Build identifier
constexpr const char* kBuildId = "dev";

}  // namespace jnorm
