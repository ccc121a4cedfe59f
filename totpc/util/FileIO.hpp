/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Filesystem access functions
 */

#ifndef TOTPC_UTIL_FILE_IO_HPP
#define TOTPC_UTIL_FILE_IO_HPP

#include <string>

namespace totpc {

/**
 * Puts a slash on the end of a filename (if necessary).
 */
std::string
fileSlashify(const std::string &path);

/**
 * Returns true if the path exists.
 */
bool
fileExists(const std::string &path);

/**
 * Finds the per-user configuration directory, with a trailing slash.
 * Mac: ~/Library/Application Support/totpc/
 * Unix: ~/.config/totpc/
 */
std::string
fileConfigDir();

} // namespace totpc

#endif
