#include <trialflow/core/error.hpp>
#include <trialflow/core/settings.hpp>

#include <gtest/gtest.h>

using namespace trialflow::core;

class SettingsTest : public ::testing::Test {};

TEST_F(SettingsTest, LocalLookup) {
    Settings s(Object{{"speed", 2.5}});
    EXPECT_DOUBLE_EQ(s.get_double("speed"), 2.5);
    EXPECT_TRUE(s.contains("speed"));
    EXPECT_TRUE(s.contains_local("speed"));
}

TEST_F(SettingsTest, MissingKeyThrows) {
    Settings s;
    EXPECT_THROW((void)s.get("missing"), KeyNotFoundError);
}

TEST_F(SettingsTest, KeyNotFoundCarriesKey) {
    Settings s;
    try {
        (void)s.get("difficulty");
        FAIL() << "expected KeyNotFoundError";
    } catch (const KeyNotFoundError& e) {
        EXPECT_EQ(e.key(), "difficulty");
    }
}

TEST_F(SettingsTest, GetOrFallsBack) {
    Settings s(Object{{"a", 1}});
    EXPECT_EQ(s.get_or("a", 5).as_int(), 1);
    EXPECT_EQ(s.get_or("b", 5).as_int(), 5);
}

// =============================================================================
// Override chain
// =============================================================================

TEST_F(SettingsTest, ThreeLevelOverride) {
    Settings session(Object{{"a", 1}});
    Settings block(Object{{"b", 2}}, &session);
    Settings trial(Object{{"a", 3}}, &block);

    EXPECT_EQ(trial.get_int("a"), 3);
    EXPECT_EQ(trial.get_int("b"), 2);
    EXPECT_EQ(block.get_int("a"), 1);
    EXPECT_THROW((void)session.get("b"), KeyNotFoundError);
}

TEST_F(SettingsTest, ParentMutationVisibleDownstream) {
    Settings session;
    Settings block(&session);
    Settings trial(&block);

    session.set("volume", 0.5);
    EXPECT_DOUBLE_EQ(trial.get_double("volume"), 0.5);

    session.set("volume", 0.8);
    EXPECT_DOUBLE_EQ(trial.get_double("volume"), 0.8);
}

TEST_F(SettingsTest, SetWritesLocallyOnly) {
    Settings session(Object{{"a", 1}});
    Settings trial(&session);

    trial.set("a", 10);

    EXPECT_EQ(trial.get_int("a"), 10);
    EXPECT_EQ(session.get_int("a"), 1);
    EXPECT_TRUE(trial.contains_local("a"));
}

TEST_F(SettingsTest, ContainsLocalIgnoresParent) {
    Settings session(Object{{"a", 1}});
    Settings block(&session);
    EXPECT_TRUE(block.contains("a"));
    EXPECT_FALSE(block.contains_local("a"));
}

TEST_F(SettingsTest, EraseRevealsParentValue) {
    Settings session(Object{{"a", 1}});
    Settings block(Object{{"a", 2}}, &session);

    EXPECT_TRUE(block.erase("a"));
    EXPECT_FALSE(block.erase("a"));
    EXPECT_EQ(block.get_int("a"), 1);
}

TEST_F(SettingsTest, AssignKeepsParent) {
    Settings session(Object{{"a", 1}});
    Settings block(Object{{"x", 0}}, &session);

    block.assign(Object{{"b", 2}});

    EXPECT_EQ(block.parent(), &session);
    EXPECT_FALSE(block.contains("x"));
    EXPECT_EQ(block.get_int("a"), 1);
    EXPECT_EQ(block.get_int("b"), 2);
}

TEST_F(SettingsTest, TypedAccessors) {
    Settings s(Object{
        {"flag", true},
        {"name", "stroop"},
        {"colors", Array{"red", "green"}},
        {"nested", Object{{"k", 1}}},
    });

    EXPECT_TRUE(s.get_bool("flag"));
    EXPECT_EQ(s.get_string("name"), "stroop");
    EXPECT_EQ(s.get_array("colors").size(), 2U);
    EXPECT_EQ(s.get_object("nested").at("k").as_int(), 1);
    EXPECT_THROW((void)s.get_int("name"), ValueTypeError);
}
