// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBARTIFETCH_VERSION_HPP
#define LIBARTIFETCH_VERSION_HPP

#include <string>

#define LIBARTIFETCH_VERSION_MAJOR 0
#define LIBARTIFETCH_VERSION_MINOR 4
#define LIBARTIFETCH_VERSION_PATCH 0

#define LIBARTIFETCH_VERSION_STRING "0.4.0"
#define LIBARTIFETCH_VERSION                                                                       \
    (LIBARTIFETCH_VERSION_MAJOR * 10000 + LIBARTIFETCH_VERSION_MINOR * 100 + LIBARTIFETCH_VERSION_PATCH)

namespace artifetch
{
    std::string version();

    /** Value of the ``User-Agent`` header sent with every request: ``artifetch/<version>``. */
    std::string user_agent();
}

#endif
