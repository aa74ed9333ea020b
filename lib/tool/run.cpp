// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <cstdio>
#include <ostream>
#include <elfpack/elf/builder.hpp>
#include <elfpack/tool/run.hpp>
#include <elfpack/util/streams.hpp>

namespace elfpack::tool {

void writeObject(const CommandLine &cl, std::ostream &log, bool &created) {
    auto out = util::FileOutputStream::create(cl.output);
    auto file = out.get();
    created = true;

    auto builder = elf::Builder::create(cl.header, std::move(out));
    if (cl.sectionName)
        builder->setSectionName(*cl.sectionName);

    for (auto &def : cl.symbols) {
        auto source = util::FileInputStream::open(def.path);
        auto record = builder->addSymbol(def.name, *source);
        if (cl.verbose)
            log << def.name << ": offset " << record.dataOffset
                    << ", size " << record.rawSize
                    << ", padded size " << record.paddedSize
                    << ", alignment " << record.alignment << std::endl;
    }

    auto stream = builder->finalize();
    file->sync();
    file->close();
}

int run(int argc, const char *const *argv, std::ostream &out, std::ostream &err) {
    const char *program = argc ? argv[0] : "elfpack";

    CommandLine cl;
    try {
        cl = parseCommandLine(argc, argv);
    } catch (const ArgumentError &e) {
        err << "elfpack: " << e.what() << std::endl;
        printUsage(err, program);
        return exit_codes::badArguments;
    }

    if (cl.help) {
        printUsage(out, program);
        return exit_codes::success;
    }

    bool created = false;
    try {
        writeObject(cl, out, created);
    } catch (const std::runtime_error &e) {
        err << "elfpack: " << e.what() << std::endl;
        // A partially written object is useless to the linker.
        if (created && std::remove(cl.output.c_str()))
            err << "elfpack: could not remove " << cl.output << std::endl;
        return exit_codes::ioFailure;
    }
    return exit_codes::success;
}

} // namespace elfpack::tool
