/**
 * @file log_version.hpp
 * @brief Version information for rotalog logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace rotalog
{

#ifndef ROTALOG_VERSION_STRING
    #define ROTALOG_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = ROTALOG_VERSION_STRING;

} // namespace rotalog
