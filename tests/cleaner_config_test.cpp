#include <gtest/gtest.h>
#include "core/cleaner_config.hpp"
#include "test_helpers.hpp"
#include <algorithm>

class CleanerConfigTest : public TempDirTest
{
protected:
    static bool contains(const std::vector<std::string> &values, const std::string &value)
    {
        return std::find(values.begin(), values.end(), value) != values.end();
    }
};

TEST_F(CleanerConfigTest, MissingFileGivesDefaults)
{
    CleanerConfig config = CleanerConfigManager::loadConfig(pathFor("nope.yaml"));
    CleanerConfig defaults;

    EXPECT_EQ(config.output_prefix, "[CLEANED]");
    EXPECT_EQ(config.placeholder_name, "arquivo");
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.cleanup_partial_output);
    EXPECT_EQ(config.image_extensions, defaults.image_extensions);
    EXPECT_EQ(config.video_extensions, defaults.video_extensions);
}

TEST_F(CleanerConfigTest, SaveAndLoadPreservesValues)
{
    CleanerConfig config;
    config.log_level = "DEBUG";
    config.output_directory = "/tmp/cleaned";
    config.output_prefix = "clean_";
    config.placeholder_name = "media";
    config.cleanup_partial_output = true;
    config.video_tool_name = "avconv";
    config.video_tool_version_marker = "avconv version";
    config.image_extensions = {"jpg", "png"};
    config.video_extensions = {"mp4"};

    std::string path = pathFor("metaclean.yaml");
    ASSERT_TRUE(CleanerConfigManager::saveConfig(config, path));
    CleanerConfig loaded = CleanerConfigManager::loadConfig(path);

    EXPECT_EQ(loaded.log_level, "DEBUG");
    EXPECT_EQ(loaded.output_directory, "/tmp/cleaned");
    EXPECT_EQ(loaded.output_prefix, "clean_");
    EXPECT_EQ(loaded.placeholder_name, "media");
    EXPECT_TRUE(loaded.cleanup_partial_output);
    EXPECT_EQ(loaded.video_tool_name, "avconv");
    EXPECT_EQ(loaded.video_tool_subdirectory, "ffmpeg");
    EXPECT_EQ(loaded.video_tool_version_marker, "avconv version");
    EXPECT_EQ(loaded.image_extensions.size(), 2u);
    EXPECT_TRUE(contains(loaded.image_extensions, "png"));
    EXPECT_EQ(loaded.video_extensions, std::vector<std::string>{"mp4"});
}

TEST_F(CleanerConfigTest, CategoriesSelectEnabledExtensions)
{
    std::string path = writeFile("partial.yaml",
                                 "output_directory: out\n"
                                 "categories:\n"
                                 "  images:\n"
                                 "    JPG: true\n"
                                 "    png: false\n"
                                 "    heic: true\n");

    CleanerConfig config = CleanerConfigManager::loadConfig(path);

    EXPECT_EQ(config.output_directory, "out");
    EXPECT_TRUE(contains(config.image_extensions, "jpg"));
    EXPECT_TRUE(contains(config.image_extensions, "heic"));
    EXPECT_FALSE(contains(config.image_extensions, "png"));
    EXPECT_EQ(config.video_extensions, CleanerConfig{}.video_extensions);
}

TEST_F(CleanerConfigTest, InvalidValuesFallBackToDefaults)
{
    std::string path = writeFile("invalid.yaml",
                                 "output_prefix: a/b\n"
                                 "placeholder_name: '***'\n"
                                 "log_level: LOUD\n"
                                 "video_tool:\n"
                                 "  name: ''\n");

    CleanerConfig config = CleanerConfigManager::loadConfig(path);

    EXPECT_EQ(config.output_prefix, "[CLEANED]");
    EXPECT_EQ(config.placeholder_name, "arquivo");
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_EQ(config.video_tool_name, "ffmpeg");
}

TEST_F(CleanerConfigTest, MalformedYamlGivesDefaults)
{
    std::string path = writeFile("broken.yaml", "output_prefix: [unclosed\n  : :\n");

    CleanerConfig config = CleanerConfigManager::loadConfig(path);

    EXPECT_EQ(config.output_prefix, "[CLEANED]");
    EXPECT_EQ(config.image_extensions, CleanerConfig{}.image_extensions);
}

TEST_F(CleanerConfigTest, ValidateReportsEveryProblem)
{
    CleanerConfig config;
    std::vector<std::string> problems;
    EXPECT_TRUE(CleanerConfigManager::validateConfig(config, problems));
    EXPECT_TRUE(problems.empty());

    config.output_prefix = "";
    config.placeholder_name = "-bad-";
    config.video_tool_version_marker = "";
    EXPECT_FALSE(CleanerConfigManager::validateConfig(config, problems));
    EXPECT_EQ(problems.size(), 3u);
}
