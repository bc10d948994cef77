/**
 * @file test_loader.cpp
 * @brief Tests for JSON/TOML file loading (GoogleTest)
 */

#include <gtest/gtest.h>
#include "tidymerge/Loader.hpp"
#include "tidymerge/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace tidymerge;

namespace {

/**
 * @brief RAII helper for temporary directories
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("tidymerge_loader_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string create_file(const std::string& name, const std::string& content) {
        fs::path file_path = path_ / name;
        std::ofstream out(file_path);
        out << content;
        return file_path.string();
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

} // namespace

// ============================================================================
// get_file_extension
// ============================================================================

TEST(GetFileExtension, Lowercased) {
    EXPECT_EQ(get_file_extension("settings.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("/a/b.c/doc.json"), ".json");
    EXPECT_EQ(get_file_extension("noext"), "");
}

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJsonFile, Object) {
    TempDir dir;
    auto path = dir.create_file("a.json", R"({"merge": {"key": "name"}})");
    EXPECT_EQ(load_json_file(path)["merge"]["key"], "name");
}

TEST(LoadJsonFile, ParseErrorCarriesFile) {
    TempDir dir;
    auto path = dir.create_file("bad.json", "{\"a\": }");
    try {
        load_json_file(path);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.file(), path);
    }
}

TEST(LoadJsonFile, Missing) {
    TempDir dir;
    EXPECT_THROW(load_json_file(dir.file("none.json")), FileNotFoundError);
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadTomlFile, TablesAndArrays) {
    TempDir dir;
    auto path = dir.create_file("a.toml",
        "[output]\n"
        "indent = 4\n"
        "ratio = 0.5\n"
        "tags = [\"x\", \"y\"]\n");

    Value v = load_toml_file(path);
    EXPECT_EQ(v["output"]["indent"], 4);
    EXPECT_DOUBLE_EQ(v["output"]["ratio"].get<double>(), 0.5);
    EXPECT_EQ(v["output"]["tags"], (Value{"x", "y"}));
}

TEST(LoadTomlFile, DatesKeptAsText) {
    TempDir dir;
    auto path = dir.create_file("d.toml", "day = 2024-01-15\n");
    EXPECT_EQ(load_toml_file(path)["day"], "2024-01-15");
}

TEST(LoadTomlFile, ParseErrorHasPosition) {
    TempDir dir;
    auto path = dir.create_file("bad.toml", "ok = 1\nbroken = = 2\n");
    try {
        load_toml_file(path);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 2);
    }
}

// ============================================================================
// load_config_file
// ============================================================================

TEST(LoadConfigFile, EmptyPathIsEmptyObject) {
    Value v = load_config_file("");
    EXPECT_TRUE(v.is_object());
    EXPECT_TRUE(v.empty());
}

TEST(LoadConfigFile, DispatchesOnExtension) {
    TempDir dir;
    auto json_path = dir.create_file("s.json", R"({"a": 1})");
    auto toml_path = dir.create_file("s.toml", "a = 2\n");
    EXPECT_EQ(load_config_file(json_path)["a"], 1);
    EXPECT_EQ(load_config_file(toml_path)["a"], 2);
}

TEST(LoadConfigFile, UnsupportedExtension) {
    TempDir dir;
    auto path = dir.create_file("s.ini", "a=1\n");
    EXPECT_THROW(load_config_file(path), TidyMergeError);
}

// ============================================================================
// write_json_file
// ============================================================================

TEST(WriteJsonFile, RoundTripsThroughLoader) {
    TempDir dir;
    const std::string path = dir.file("out.json");
    Value data = {{"nodes", Value::array()}};
    write_json_file(path, data, 4);
    EXPECT_EQ(load_json_file(path), data);
}

TEST(WriteJsonFile, UnwritablePath) {
    EXPECT_THROW(write_json_file("/nonexistent/dir/out.json", Value::object()), TidyMergeError);
}
