// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <elfpack/tool/run.hpp>
#include "elf-reader.hpp"

namespace elfpack::tool {
namespace {

namespace fs = std::filesystem;

struct RunTest : testing::Test {
    void SetUp() override {
        dir = fs::temp_directory_path() / ("elfpack-run-test-"
                + std::string{testing::UnitTest::GetInstance()->current_test_info()->name()});
        fs::remove_all(dir);
        fs::create_directories(dir);
        output = (dir / "out.o").string();
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    std::string writeInput(const std::string &name, const std::string &contents) {
        auto path = (dir / name).string();
        std::ofstream f{path, std::ios::binary};
        f << contents;
        return path;
    }

    int invoke(std::vector<std::string> args) {
        args.insert(args.begin(), "elfpack");
        std::vector<const char *> argv;
        for (auto &arg : args)
            argv.push_back(arg.c_str());
        return run(static_cast<int>(argv.size()), argv.data(), out, err);
    }

    fs::path dir;
    std::string output;
    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(RunTest, WritesObject) {
    auto input = writeInput("greeting.txt", "hello");
    EXPECT_EQ(invoke({"--class", "elf32", "-o", output, "greeting=" + input}),
            exit_codes::success);
    ASSERT_TRUE(fs::exists(output));

    std::ifstream f{output, std::ios::binary};
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>{f},
            std::istreambuf_iterator<char>{}};
    test::ElfReader elf{bytes};
    EXPECT_FALSE(elf.is64);
    ASSERT_EQ(elf.symbols.size(), 2u);
    EXPECT_EQ(elf.symbols[1].name, "greeting");
    EXPECT_EQ(elf.symbols[1].size, 5u);
}

TEST_F(RunTest, MissingInputRemovesOutput) {
    auto present = writeInput("present.bin", "data");
    EXPECT_EQ(invoke({"-o", output, "a=" + present, "b=" + (dir / "missing.bin").string()}),
            exit_codes::ioFailure);
    EXPECT_FALSE(fs::exists(output));
    EXPECT_NE(err.str().find("missing.bin"), std::string::npos);
}

TEST_F(RunTest, MalformedSymbolCreatesNothing) {
    auto input = writeInput("input.bin", "data");
    EXPECT_EQ(invoke({"-o", output, input}), exit_codes::badArguments);
    EXPECT_FALSE(fs::exists(output));
    EXPECT_NE(err.str().find("NAME=FILENAME"), std::string::npos);
}

TEST_F(RunTest, Help) {
    EXPECT_EQ(invoke({"--help"}), exit_codes::success);
    EXPECT_NE(out.str().find("Usage:"), std::string::npos);
}

} // namespace
} // namespace elfpack::tool
