// test_log_gtest.cpp - Unit tests for category logging and log.conf parsing

#include <gtest/gtest.h>
#include "lib/log.h"
#include "cardpage/card_log.hpp"
#include "cardpage/card_paginate.hpp"
#include <string>

class LogTest : public ::testing::Test {
protected:
    FILE* sink;

    void SetUp() override {
        log_init(nullptr);
        sink = tmpfile();
        ASSERT_NE(sink, nullptr);
    }

    void TearDown() override {
        log_fini();
        if (sink) fclose(sink);
    }

    std::string read_sink() {
        std::string out;
        fflush(sink);
        rewind(sink);
        char buf[512];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), sink)) > 0) out.append(buf, n);
        return out;
    }
};

// ============================================================================
// Levels
// ============================================================================

TEST_F(LogTest, LevelNames) {
    EXPECT_EQ(log_level_from_string("debug"), LOG_LEVEL_DEBUG);
    EXPECT_EQ(log_level_from_string("Warning"), LOG_LEVEL_WARN);
    EXPECT_GT(log_level_from_string("off"), LOG_LEVEL_FATAL);
    EXPECT_LT(log_level_from_string("verbose"), 0);
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_ERROR), "ERROR");
}

TEST_F(LogTest, DefaultCategory) {
    log_category_t* def = log_get_category("*");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def, log_default_category);
    EXPECT_EQ(log_get_category("default"), def);
    EXPECT_EQ(def->level, LOG_LEVEL_WARN);
}

TEST_F(LogTest, CategoryInheritsDefault) {
    log_set_level(log_get_category("*"), LOG_LEVEL_INFO);
    log_category_t* cat = log_get_category("test.inherit");
    ASSERT_NE(cat, nullptr);
    EXPECT_EQ(cat->level, LOG_LEVEL_INFO);
    EXPECT_EQ(log_get_category("test.inherit"), cat);
}

// ============================================================================
// Output
// ============================================================================

TEST_F(LogTest, MessagesBelowLevelAreDropped) {
    log_category_t* cat = log_get_category("test.cat");
    log_set_output(cat, sink);
    log_set_level(cat, LOG_LEVEL_WARN);

    clog_debug(cat, "hidden %d", 1);
    clog_warn(cat, "hello %d", 5);

    std::string out = read_sink();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("WARN"), std::string::npos);
    EXPECT_NE(out.find("[test.cat] hello 5"), std::string::npos);
    EXPECT_FALSE(log_level_enabled(cat, LOG_LEVEL_DEBUG));
    EXPECT_TRUE(log_level_enabled(cat, LOG_LEVEL_ERROR));
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(LogTest, ParseConfigString) {
    const char* config =
        "# card pagination logging\n"
        "* = error\n"
        "cardpage.paginate = debug\n"
        "\n"
        "cardpage.segment = info, stderr   # inline comment\n"
        "timestamps = off\n";
    EXPECT_EQ(log_parse_config_string(config), LOG_OK);
    EXPECT_EQ(log_get_category("*")->level, LOG_LEVEL_ERROR);
    EXPECT_EQ(log_get_category("cardpage.paginate")->level, LOG_LEVEL_DEBUG);
    EXPECT_EQ(log_get_category("cardpage.segment")->level, LOG_LEVEL_INFO);
    EXPECT_EQ(log_get_category("cardpage.segment")->output, stderr);
}

TEST_F(LogTest, MalformedConfigLines) {
    EXPECT_EQ(log_parse_config_string("no equals sign\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("cardpage.unitize = loud\n"), LOG_WRONG_FORMAT);
    // later valid lines still apply
    EXPECT_EQ(log_parse_config_string("bad line\ncardpage.unitize = error\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_get_category("cardpage.unitize")->level, LOG_LEVEL_ERROR);
}

TEST_F(LogTest, OffSilencesCategory) {
    ASSERT_EQ(log_parse_config_string("test.quiet = off\n"), LOG_OK);
    log_category_t* cat = log_get_category("test.quiet");
    log_set_output(cat, sink);
    clog_error(cat, "should not appear");
    EXPECT_TRUE(read_sink().empty());
}

TEST_F(LogTest, MissingConfigFile) {
    EXPECT_EQ(log_parse_config_file("/nonexistent/cardpage/log.conf"), LOG_INIT_FAIL);
}

// ============================================================================
// Engine Categories
// ============================================================================

TEST_F(LogTest, EngineCategoriesResolvedOnce) {
    ASSERT_EQ(log_parse_config_string("cardpage.paginate = debug\n"), LOG_OK);
    init_cardpage_logging();
    ASSERT_NE(segment_log, nullptr);
    ASSERT_NE(unitize_log, nullptr);
    ASSERT_NE(paginate_log, nullptr);
    EXPECT_STREQ(paginate_log->name, "cardpage.paginate");
    EXPECT_EQ(paginate_log->level, LOG_LEVEL_DEBUG);
    EXPECT_EQ(log_get_category("cardpage.segment"), segment_log);

    log_set_output(paginate_log, sink);
    cardpage::PaginationConstraints c = {332, 300, 480, 156};
    cardpage::paginate("Hello.", {}, {}, c);
    EXPECT_NE(read_sink().find("[cardpage.paginate] paginate: produced 1 pages"), std::string::npos);

    segment_log = unitize_log = paginate_log = NULL;
}

TEST_F(LogTest, EngineLogsNothingBeforeInit) {
    segment_log = unitize_log = paginate_log = NULL;
    cardpage::PaginationConstraints c = {332, 300, 480, 156};
    std::vector<cardpage::Page> pages = cardpage::paginate("Hello. [image9]", {}, {}, c);
    EXPECT_EQ(pages.size(), 1u);
}
