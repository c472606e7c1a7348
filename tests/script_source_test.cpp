#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "script/script_source.hpp"

using runbox::script::FetchScript;
using runbox::script::IsUrlReference;
using runbox::script::ScriptLoadError;

TEST(ScriptSource, RecognisesUrlReferences) {
    EXPECT_TRUE(IsUrlReference("http://example.com/mod.js"));
    EXPECT_TRUE(IsUrlReference("https://example.com/mod.js"));
    EXPECT_TRUE(IsUrlReference("file:///tmp/mod.js"));
    EXPECT_FALSE(IsUrlReference("export function f() {}"));
    EXPECT_FALSE(IsUrlReference("ftp://example.com/mod.js"));
    EXPECT_FALSE(IsUrlReference(" https://example.com/mod.js"));
}

TEST(ScriptSource, ReadsFileUrls) {
    const auto path = std::filesystem::temp_directory_path() / "runbox_script_source_test.js";
    {
        std::ofstream output(path, std::ios::trunc);
        output << "export const answer = 42;\n";
    }
    EXPECT_EQ(FetchScript("file://" + path.string()), "export const answer = 42;\n");
    std::filesystem::remove(path);
}

TEST(ScriptSource, MissingFileThrows) {
    EXPECT_THROW(FetchScript("file:///nonexistent/runbox/missing.js"), ScriptLoadError);
}

TEST(ScriptSource, UnreachableHostThrows) {
    EXPECT_THROW(FetchScript("http://127.0.0.1:1/mod.js", std::chrono::seconds(2)), ScriptLoadError);
}

TEST(ScriptSource, UnsupportedSchemeThrows) {
    EXPECT_THROW(FetchScript("ftp://example.com/mod.js"), ScriptLoadError);
}
