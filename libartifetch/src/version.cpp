// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "artifetch/version.hpp"

namespace artifetch
{
    std::string version()
    {
        return LIBARTIFETCH_VERSION_STRING;
    }

    std::string user_agent()
    {
        return "artifetch/" + version();
    }
}
