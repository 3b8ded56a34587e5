#include <gtest/gtest.h>
#include "../lib/log.h"
#include "../lib/strbuf.h"
#include <string>
#include <string.h>
#include <thread>
#include <vector>

// read everything written to a temporary stream
static std::string slurp(FILE* file) {
    fflush(file);
    rewind(file);
    std::string out;
    char chunk[256];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) out.append(chunk, n);
    return out;
}

class LogTest : public ::testing::Test {
protected:
    FILE* sink = nullptr;

    void SetUp() override {
        ASSERT_EQ(log_init(NULL), LOG_OK);
        sink = tmpfile();
        ASSERT_NE(sink, nullptr);
        log_set_output(log_default_category, sink);
        log_set_level(log_default_category, LOG_LEVEL_WARN);
    }

    void TearDown() override {
        if (log_default_category) log_set_output(log_default_category, stderr);
        if (sink) fclose(sink);
    }
};

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_ERROR), "ERROR");
    EXPECT_EQ(log_level_from_string("warning"), LOG_LEVEL_WARN);
    EXPECT_EQ(log_level_from_string("INFO"), LOG_LEVEL_INFO);
    EXPECT_EQ(log_level_from_string("loud"), -1);
    EXPECT_EQ(log_level_from_string(NULL), -1);
}

TEST_F(LogTest, FiltersBelowLevel) {
    log_debug("hidden %d", 1);
    log_info("hidden too");
    log_warn("shown %d", 2);
    log_error("also shown");
    EXPECT_EQ(slurp(sink), "[WARN] shown 2\n[ERROR] also shown\n");
}

TEST_F(LogTest, LevelEnabled) {
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_DEBUG));
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_FATAL));
    EXPECT_FALSE(log_level_enabled(NULL, LOG_LEVEL_FATAL));
}

TEST_F(LogTest, ConfigStringSetsLevel) {
    EXPECT_EQ(log_parse_config_string("level=debug"), LOG_OK);
    log_debug("now visible");
    EXPECT_EQ(slurp(sink), "[DEBUG] now visible\n");
}

TEST_F(LogTest, ConfigCanDisable) {
    EXPECT_EQ(log_parse_config_string("default.enabled=false"), LOG_OK);
    log_error("muted");
    EXPECT_EQ(slurp(sink), "");
}

TEST_F(LogTest, NamedCategory) {
    log_category_t* cat = log_get_category("figure");
    ASSERT_NE(cat, nullptr);
    EXPECT_EQ(log_get_category("figure"), cat);
    log_set_output(cat, sink);
    log_set_level(cat, LOG_LEVEL_DEBUG);
    clog_debug(cat, "matched %d", 3);
    EXPECT_EQ(slurp(sink), "[DEBUG] figure: matched 3\n");
    log_set_output(cat, stderr);
}

TEST_F(LogTest, BadConfigEntry) {
    EXPECT_NE(log_parse_config_string("level=shouting"), LOG_OK);
    EXPECT_NE(log_parse_config_string("nokey"), LOG_OK);
}

TEST(LogRegistry, DefaultCategoryAlwaysPresent) {
    ASSERT_NE(log_default_category, nullptr);
    EXPECT_STREQ(log_default_category->name, "default");
    log_finish();
    ASSERT_NE(log_default_category, nullptr);
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_FATAL));
    EXPECT_EQ(log_get_category("default"), log_default_category);
    EXPECT_EQ(log_init(NULL), LOG_OK);
}

TEST(LogRegistry, ConcurrentLookupYieldsOneCategory) {
    ASSERT_EQ(log_init(NULL), LOG_OK);
    const int thread_count = 8;
    std::vector<log_category_t*> found(thread_count, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; i++) {
        threads.emplace_back([&found, i]() {
            found[i] = log_get_category("matcher");
            log_debug("worker %d", i);
        });
    }
    for (std::thread& t : threads) t.join();
    ASSERT_NE(found[0], nullptr);
    for (log_category_t* cat : found) {
        EXPECT_EQ(cat, found[0]);
    }
}

TEST(StrBuf, AppendVariants) {
    StrBuf* sb = strbuf_new();
    ASSERT_NE(sb, nullptr);
    strbuf_append_str(sb, "fig");
    strbuf_append_char(sb, '-');
    strbuf_append_str_n(sb, "markdown", 4);
    strbuf_append_char_n(sb, '!', 2);
    strbuf_append_int(sb, -42);
    strbuf_append_format(sb, " %s=%d", "n", 7);
    EXPECT_STREQ(sb->str, "fig-mark!!-42 n=7");
    EXPECT_EQ(sb->length, strlen(sb->str));
    strbuf_free(sb);
}

TEST(StrBuf, GrowsPastInitialCapacity) {
    StrBuf* sb = strbuf_new_cap(4);
    for (int i = 0; i < 100; i++) strbuf_append_str(sb, "abcdefgh");
    EXPECT_EQ(sb->length, 800u);
    EXPECT_GE(sb->capacity, 801u);
    strbuf_free(sb);
}

TEST(StrBuf, ResetAndTruncate) {
    StrBuf* sb = strbuf_create("hello world");
    strbuf_truncate(sb, 5);
    EXPECT_STREQ(sb->str, "hello");
    strbuf_truncate(sb, 50);
    EXPECT_STREQ(sb->str, "hello");
    strbuf_reset(sb);
    EXPECT_EQ(sb->length, 0u);
    EXPECT_STREQ(sb->str, "");
    strbuf_free(sb);
}

TEST(StrBuf, AppendFile) {
    FILE* file = tmpfile();
    ASSERT_NE(file, nullptr);
    fputs("![A](a.png)\nCaption", file);
    rewind(file);
    StrBuf* sb = strbuf_new();
    EXPECT_TRUE(strbuf_append_file(sb, file));
    EXPECT_STREQ(sb->str, "![A](a.png)\nCaption");
    strbuf_free(sb);
    fclose(file);
}
