// tests/test_layer3_store/test_action.cpp
/**
 * @file test_action.cpp
 * @brief Unit tests for the action model, the reserved action types and StoreError.
 */
#include "sth_store.hpp"
#include "gtest/gtest.h"

using namespace statehub::store;

TEST(ActionTest, PlainRecordPredicate)
{
    EXPECT_TRUE(is_plain_record(Action::object()));
    EXPECT_TRUE(is_plain_record(Action{{"type", "X"}}));
    EXPECT_FALSE(is_plain_record(Action::array()));
    EXPECT_FALSE(is_plain_record(Action("X")));
    EXPECT_FALSE(is_plain_record(Action(42)));
    EXPECT_FALSE(is_plain_record(Action(true)));
    EXPECT_FALSE(is_plain_record(Action()));
}

TEST(ActionTest, HasActionType)
{
    EXPECT_TRUE(has_action_type(make_action("X")));
    EXPECT_TRUE(has_action_type(Action{{"type", nullptr}}));
    EXPECT_FALSE(has_action_type(Action{{"kind", "X"}}));
    EXPECT_FALSE(has_action_type(Action::array({"type"})));
}

TEST(ActionTest, MakeAction)
{
    auto plain = make_action("ADD");
    EXPECT_EQ(plain, (Action{{"type", "ADD"}}));

    auto with_payload = make_action("ADD", {{"amount", 3}});
    EXPECT_EQ(with_payload.at("type"), "ADD");
    EXPECT_EQ(with_payload.at("payload").at("amount"), 3);
}

TEST(ActionTest, TypeNameForLogging)
{
    EXPECT_EQ(action_type_name(make_action("ADD")), "ADD");
    EXPECT_EQ(action_type_name(Action{{"type", 5}}), "5");
    EXPECT_EQ(action_type_name(Action{{"type", nullptr}}), "null");
    EXPECT_EQ(action_type_name(Action::object()), "<none>");
}

TEST(ActionTypesTest, ReservedTypesAreDistinctAndStable)
{
    const std::string &init = action_types::init();
    const std::string &replace = action_types::replace();

    EXPECT_EQ(init.rfind("@@statehub/INIT", 0), 0u);
    EXPECT_EQ(replace.rfind("@@statehub/REPLACE", 0), 0u);
    EXPECT_NE(init, replace);
    EXPECT_EQ(&init, &action_types::init());
    // Random suffix: six base-36 characters joined by dots.
    EXPECT_EQ(init.size(), std::string("@@statehub/INIT").size() + 11);
}

TEST(ActionTypesTest, IsReserved)
{
    EXPECT_TRUE(action_types::is_reserved(make_action(action_types::init())));
    EXPECT_TRUE(action_types::is_reserved(make_action(action_types::replace())));
    EXPECT_FALSE(action_types::is_reserved(make_action("@@statehub/INIT")));
    EXPECT_FALSE(action_types::is_reserved(Action::object()));
}

TEST(StoreErrorTest, CarriesKindAndMessage)
{
    StoreError err(ErrorKind::PrematureDispatch, "too early");
    EXPECT_EQ(err.kind(), ErrorKind::PrematureDispatch);
    EXPECT_STREQ(err.what(), "too early");
    EXPECT_STREQ(to_string(ErrorKind::IllegalStateAccess), "IllegalStateAccess");
    EXPECT_STREQ(to_string(ErrorKind::InvalidAction), "InvalidAction");
}
