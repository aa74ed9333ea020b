// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#pragma once

#include <iosfwd>
#include <elfpack/tool/options.hpp>

namespace elfpack::tool {

namespace exit_codes {
    enum : int {
        success = 0,
        ioFailure = 1,
        badArguments = 2
    };
}

// Writes the object described by cl. Throws on I/O failure; set created once the
// output file exists.
void writeObject(const CommandLine &cl, std::ostream &log, bool &created);

// Runs the elfpack tool and returns its exit code.
// Argument errors are reported before any output is created; on I/O failure the
// partially written output is removed.
int run(int argc, const char *const *argv, std::ostream &out, std::ostream &err);

} // namespace elfpack::tool
