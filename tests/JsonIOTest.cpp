#include <gtest/gtest.h>

#include "io/JsonIO.hpp"
#include "tags/TagParser.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

static fs::path scratch_dir() {
    fs::path dir = fs::temp_directory_path() / "tag_catalog_json_test";
    fs::create_directories(dir);
    return dir;
}

static fs::path write_text(const std::string& name, const std::string& body) {
    fs::path p = scratch_dir() / name;
    std::ofstream out(p);
    out << body;
    return p;
}

TEST(JsonIOTest, GroupsToJsonKeepsOrder) {
    auto parser = tags::TagParser::from_text("[B]\ny\n[A]\nx one\nx one\n[Empty]\n");
    nlohmann::json j = tags::groups_to_json(parser.groups());

    ASSERT_TRUE(j.at("groups").is_array());
    ASSERT_EQ(j.at("groups").size(), 3u);
    EXPECT_EQ(j["groups"][0]["name"], "B");
    EXPECT_EQ(j["groups"][1]["name"], "A");
    ASSERT_EQ(j["groups"][1]["tags"].size(), 2u);
    EXPECT_EQ(j["groups"][1]["tags"][1], "x one");
    EXPECT_TRUE(j["groups"][2]["tags"].is_array());
    EXPECT_TRUE(j["groups"][2]["tags"].empty());
}

TEST(JsonIOTest, WriteThenLoadFixtureCatalog) {
    auto parser = tags::TagParser::from_path((fs::path(TAGS_TEST_DATA_DIR) / "test_data.txt").string());
    parser.parse();

    const fs::path out = scratch_dir() / "nested" / "catalog.json";
    fs::remove_all(out.parent_path());
    tags::write_groups_json(out, parser.groups());
    ASSERT_TRUE(fs::exists(out));

    auto loaded = tags::load_groups_json(out.string());
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].name, "Generic");
    ASSERT_EQ(loaded[0].tags.size(), 3u);
    EXPECT_EQ(loaded[0].tags[2], "進撃の巨人");
    EXPECT_EQ(loaded[1].name, "IDs");
    EXPECT_EQ(loaded[1].tags, std::vector<std::string>{"102349"});
}

TEST(JsonIOTest, LoadMissingFileThrowsIoError) {
    EXPECT_THROW(tags::load_groups_json((scratch_dir() / "nope.json").string()), tags::IoError);
}

TEST(JsonIOTest, LoadRejectsBadShapes) {
    auto p = write_text("not_json.json", "{ this is not json");
    EXPECT_THROW(tags::load_groups_json(p.string()), std::runtime_error);

    p = write_text("root_array.json", "[]");
    EXPECT_THROW(tags::load_groups_json(p.string()), std::runtime_error);

    p = write_text("no_groups.json", "{}");
    EXPECT_THROW(tags::load_groups_json(p.string()), std::runtime_error);

    p = write_text("bad_tag.json", R"({"groups": [{"name": "A", "tags": ["x", 7]}]})");
    try {
        tags::load_groups_json(p.string());
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "root.groups[0].tags[1] must be a string");
    }

    p = write_text("no_name.json", R"({"groups": [{"tags": []}]})");
    try {
        tags::load_groups_json(p.string());
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "root.groups[0] missing required field: name");
    }
}

TEST(JsonIOTest, LoadRejectsNonObjectGroup) {
    auto p = write_text("group_not_object.json", R"({"groups": [5]})");
    try {
        tags::load_groups_json(p.string());
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "root.groups[0] must be an object");
    }

    p = write_text("tags_not_array.json", R"({"groups": [{"name": "A", "tags": "x"}]})");
    EXPECT_THROW(tags::load_groups_json(p.string()), std::runtime_error);
}

TEST(JsonIOTest, WriteUnderRegularFileThrowsIoError) {
    // the parent "directory" is a plain file, so it cannot be created
    const fs::path blocker = write_text("blocker.txt", "not a directory");
    const fs::path out = blocker / "catalog.json";

    try {
        tags::write_groups_json(out, {});
        FAIL() << "expected IoError";
    } catch (const tags::IoError& e) {
        EXPECT_EQ(e.path(), out.string());
    }
}
