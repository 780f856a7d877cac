/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once

#include <fc/filesystem.hpp>

namespace tradesafe { namespace utilities {

/**
 * Base directory for scratch data, `TRADESAFE_TEMPDIR` overrides the system
 * default. The directory is created when missing.
 */
fc::path temp_directory_path();

}}  // namespace tradesafe::utilities
