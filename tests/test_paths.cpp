/**
 * @file test_paths.cpp
 * @brief Unit tests for filesystem-checked path properties
 */

#include <gtest/gtest.h>
#include "flatcfg/Accessors.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/Paths.hpp"

#include "TestSupport.hpp"

using namespace flatcfg;
using flatcfg::test::TempDir;

namespace fs = std::filesystem;

class PathsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_path = tmp.create_dir("data").lexically_normal();
        file_path = tmp.create_file("app.log", "x").lexically_normal();
        missing_path = (tmp.path() / "missing").lexically_normal();

        props["dir"] = dir_path.string();
        props["file"] = file_path.string();
        props["missing"] = missing_path.string();
        props["dotted"] = (tmp.path() / "data" / ".." / "app.log").string();
    }

    TempDir tmp;
    fs::path dir_path;
    fs::path file_path;
    fs::path missing_path;
    Properties props;
};

TEST_F(PathsTest, DirPathMayBeMissing) {
    EXPECT_EQ(get_required_dir_path(props, "dir").string(), dir_path.string());
    EXPECT_EQ(get_required_dir_path(props, "missing").string(), missing_path.string());
    EXPECT_THROW(get_required_dir_path(props, "file"), PathKindError);
}

TEST_F(PathsTest, FilePathMayBeMissing) {
    EXPECT_EQ(get_required_file_path(props, "file").string(), file_path.string());
    EXPECT_EQ(get_required_file_path(props, "missing").string(), missing_path.string());
    EXPECT_THROW(get_required_file_path(props, "dir"), PathKindError);
}

TEST_F(PathsTest, ExistingDirPath) {
    EXPECT_EQ(get_required_existing_dir_path(props, "dir").string(), dir_path.string());
    EXPECT_THROW(get_required_existing_dir_path(props, "missing"), PathNotFoundError);
    EXPECT_THROW(get_required_existing_dir_path(props, "file"), PathKindError);
}

TEST_F(PathsTest, ExistingFilePath) {
    EXPECT_EQ(get_required_existing_file_path(props, "file").string(), file_path.string());
    EXPECT_THROW(get_required_existing_file_path(props, "missing"), PathNotFoundError);
    EXPECT_THROW(get_required_existing_file_path(props, "dir"), PathKindError);
}

TEST_F(PathsTest, ResultIsNormalized) {
    EXPECT_EQ(get_required_existing_file_path(props, "dotted").string(), file_path.string());
}

TEST_F(PathsTest, ErrorsNameKeyAndKind) {
    try {
        get_required_existing_dir_path(props, "missing");
        FAIL() << "expected PathNotFoundError";
    } catch (const PathNotFoundError& e) {
        EXPECT_EQ(e.key(), "missing");
        EXPECT_EQ(e.expected(), "directory");
        EXPECT_EQ(std::string(e.what()).rfind("Directory must exist for property 'missing'", 0),
                  0u);
    }

    try {
        get_required_dir_path(props, "file");
        FAIL() << "expected PathKindError";
    } catch (const PathKindError& e) {
        EXPECT_EQ(e.key(), "file");
        EXPECT_EQ(e.expected(), "directory");
    }
}

TEST_F(PathsTest, NonStringValueIsStringified) {
    props["numbered"] = std::int32_t{42};
    auto expected = fs::absolute("42").lexically_normal();

    EXPECT_EQ(get_required_dir_path(props, "numbered").string(), expected.string());
    EXPECT_EQ(get_required_file_path(props, "numbered").string(), expected.string());
    EXPECT_THROW(get_required_path(props, "numbered"), CoercionTypeError);
}

TEST_F(PathsTest, MissingKeyIsMissingRequired) {
    EXPECT_THROW(get_required_dir_path(props, "absent"), MissingRequiredError);
    EXPECT_THROW(get_required_existing_file_path(props, "absent"), MissingRequiredError);
}

TEST_F(PathsTest, ConsumeVariants) {
    EXPECT_EQ(consume_required_dir_path(props, "dir").string(), dir_path.string());
    EXPECT_EQ(consume_required_file_path(props, "missing").string(), missing_path.string());
    EXPECT_EQ(consume_required_existing_file_path(props, "file").string(), file_path.string());
    EXPECT_EQ(props.size(), 1u);

    props["dir"] = dir_path.string();
    EXPECT_EQ(consume_required_existing_dir_path(props, "dir").string(), dir_path.string());
    EXPECT_EQ(props.count("dir"), 0u);

    props["dir"] = file_path.string();
    EXPECT_THROW(consume_required_existing_dir_path(props, "dir"), PathKindError);
    EXPECT_EQ(props.count("dir"), 1u);
}
