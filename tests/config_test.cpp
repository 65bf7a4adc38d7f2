#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "sketchkit/config.hpp"

using sketchkit::SketchConfig;

TEST(ConfigTest, Defaults) {
    auto config = sketchkit::DefaultConfig();
    ASSERT_TRUE(config.Validate());
    ASSERT_EQ(config.bloom_capacity, 10000);
    ASSERT_DOUBLE_EQ(config.bloom_false_positive_rate, 0.01);
    ASSERT_EQ(config.hll_precision, 14);
    ASSERT_EQ(config.cms_width, 1000);
    ASSERT_EQ(config.cms_depth, 5);
    ASSERT_EQ(config.cuckoo_bucket_size, 4);
    ASSERT_EQ(config.minhash_num_perm, 128);
    ASSERT_EQ(config.minhash_seed, 42);
    ASSERT_EQ(config.topk_k, 10);
    ASSERT_EQ(config.hash_function, "xxh64");
    ASSERT_FALSE(config.verbose_logging);
}

TEST(ConfigTest, Validate) {
    SketchConfig config;
    config.bloom_false_positive_rate = 1.5;
    ASSERT_FALSE(config.Validate());

    config = SketchConfig();
    config.hll_precision = 3;
    ASSERT_FALSE(config.Validate());

    config = SketchConfig();
    config.cms_depth = 0;
    ASSERT_FALSE(config.Validate());

    config = SketchConfig();
    config.cuckoo_fingerprint_size = 40;
    ASSERT_FALSE(config.Validate());

    config = SketchConfig();
    config.topk_k = 0;
    ASSERT_FALSE(config.Validate());

    config = SketchConfig();
    config.hash_function = "sha1";
    ASSERT_FALSE(config.Validate());

    config = SketchConfig();
    config.log_level = "TRACE";
    ASSERT_FALSE(config.Validate());
}

TEST(ConfigTest, ShouldLog) {
    SketchConfig config;
    ASSERT_FALSE(config.ShouldLog("ERROR"));

    config.verbose_logging = true;
    ASSERT_FALSE(config.ShouldLog("DEBUG"));
    ASSERT_TRUE(config.ShouldLog("INFO"));
    ASSERT_TRUE(config.ShouldLog("ERROR"));

    config.log_level = "WARN";
    ASSERT_FALSE(config.ShouldLog("INFO"));
    ASSERT_TRUE(config.ShouldLog("WARN"));

    config.log_level = "DEBUG";
    ASSERT_TRUE(config.ShouldLog("DEBUG"));
}

TEST(ConfigTest, Set) {
    SketchConfig config;
    ASSERT_TRUE(config.Set("hll_precision", "12"));
    ASSERT_TRUE(config.Set("bloom_false_positive_rate", "0.001"));
    ASSERT_TRUE(config.Set("verbose_logging", "yes"));
    ASSERT_TRUE(config.Set("hash_function", "fnv1a"));
    ASSERT_TRUE(config.Set("minhash_seed", "7"));
    ASSERT_EQ(config.hll_precision, 12);
    ASSERT_DOUBLE_EQ(config.bloom_false_positive_rate, 0.001);
    ASSERT_TRUE(config.verbose_logging);
    ASSERT_EQ(config.hash_function, "fnv1a");
    ASSERT_EQ(config.minhash_seed, 7);

    ASSERT_FALSE(config.Set("cms_width", "wide"));
    ASSERT_FALSE(config.Set("cms_width", "-5"));
    ASSERT_FALSE(config.Set("verbose_logging", "maybe"));
    ASSERT_EQ(config.cms_width, 1000);

    // 未知 key 忽略
    ASSERT_TRUE(config.Set("no_such_key", "1"));
}

TEST(ConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "sketchkit_config_test.conf";
    {
        std::ofstream out(path);
        out << "# sketchkit\n"
            << "\n"
            << "cms_width = 2048\n"
            << "  cms_depth=7  \n"
            << "topk_k = 25\n"
            << "seed = 99\n";
    }
    SketchConfig config;
    ASSERT_TRUE(config.LoadFromFile(path));
    ASSERT_EQ(config.cms_width, 2048);
    ASSERT_EQ(config.cms_depth, 7);
    ASSERT_EQ(config.topk_k, 25);
    ASSERT_EQ(config.seed, 99);
    ASSERT_TRUE(config.Validate());

    {
        std::ofstream out(path);
        out << "hll_precision = 10\n"
            << "this line is broken\n"
            << "cms_depth = deep\n";
    }
    SketchConfig broken;
    ASSERT_FALSE(broken.LoadFromFile(path));
    // 合法的行仍然生效
    ASSERT_EQ(broken.hll_precision, 10);
    ASSERT_EQ(broken.cms_depth, 5);
    std::filesystem::remove(path);

    SketchConfig missing;
    ASSERT_FALSE(missing.LoadFromFile(path));
}

TEST(ConfigTest, LoadFromEnv) {
    setenv("SKETCHKIT_HLL_PRECISION", "9", 1);
    setenv("SKETCHKIT_VERBOSE_LOGGING", "true", 1);
    setenv("SKETCHKIT_CMS_WIDTH", "not-a-number", 1);
    SketchConfig config;
    config.LoadFromEnv();
    unsetenv("SKETCHKIT_HLL_PRECISION");
    unsetenv("SKETCHKIT_VERBOSE_LOGGING");
    unsetenv("SKETCHKIT_CMS_WIDTH");

    ASSERT_EQ(config.hll_precision, 9);
    ASSERT_TRUE(config.verbose_logging);
    ASSERT_EQ(config.cms_width, 1000);
}
