/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

namespace totpc {

std::string
fileSlashify(const std::string &path)
{
    if (path.empty())
        return "/";
    return path.back() == '/' ? path : path + '/';
}

bool
fileExists(const std::string &path)
{
    return 0 == access(path.c_str(), F_OK);
}

std::string
fileConfigDir()
{
    const char *home = getenv("HOME");
    if (!home || !strlen(home))
        home = "/";

#ifdef MAC_OSX
    return fileSlashify(home) + "Library/Application Support/totpc/";
#else
    return fileSlashify(home) + ".config/totpc/";
#endif
}

} // namespace totpc
