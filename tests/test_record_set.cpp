#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>

#include "core/record_set.hpp"
#include "core/value.hpp"

using namespace fchat::core;

TEST(Projection, KeepsRequiredFieldsInRequestedOrder)
{
    const Record r{{"A", int64_t{1}}, {"B", int64_t{2}}, {"C", int64_t{3}}};

    const Record ac = project(r, {"A", "C"});
    EXPECT_EQ(ac, (Record{{"A", int64_t{1}}, {"C", int64_t{3}}}));

    const Record ca = project(r, {"C", "A"});
    ASSERT_EQ(ca.size(), 2u);
    EXPECT_EQ(ca.fields()[0].name, "C");
    EXPECT_EQ(ca.fields()[1].name, "A");
}

TEST(Projection, EmptyListKeepsTheRecord)
{
    const Record r{{"A", int64_t{1}}, {"B", int64_t{2}}, {"C", int64_t{3}}};
    EXPECT_EQ(project(r, {}), r);
}

TEST(Projection, AbsentFieldsAreOmitted)
{
    const Record r{{"Alt", 12.5}, {"TimeUS", uint64_t{100}}};
    const Record p = project(r, {"Alt", "Spd"});
    EXPECT_EQ(p, (Record{{"Alt", 12.5}}));

    EXPECT_TRUE(project(r, {"Nope"}).empty());
}

TEST(RecordSet, KeepsFirstTenRecordsPerType)
{
    DecodedRecordSet set;
    for (int i = 0; i < 100; ++i)
        set.add("GPS", Record{{"I", int64_t{i}}});

    const auto* gps = set.find("GPS");
    ASSERT_NE(gps, nullptr);
    ASSERT_EQ(gps->size(), kMaxRecordsPerType);
    EXPECT_EQ(std::get<int64_t>(*gps->front().find("I")), 0);
    EXPECT_EQ(std::get<int64_t>(*gps->back().find("I")), 9);
}

TEST(RecordSet, AddReportsFullType)
{
    DecodedRecordSet set;
    for (std::size_t i = 0; i < kMaxRecordsPerType; ++i)
        EXPECT_TRUE(set.add("ATT", Record{}));
    EXPECT_FALSE(set.add("ATT", Record{}));
    EXPECT_TRUE(set.add("GPS", Record{}));
    EXPECT_EQ(set.type_count(), 2u);
}

TEST(RecordSet, AssignTruncatesAndEraseRemoves)
{
    DecodedRecordSet set;
    set.assign("BAT", std::vector<Record>(25));
    EXPECT_EQ(set.find("BAT")->size(), kMaxRecordsPerType);

    set.erase("BAT");
    EXPECT_EQ(set.find("BAT"), nullptr);
    EXPECT_TRUE(set.empty());
}

TEST(RecordSet, ToJsonGroupsByType)
{
    DecodedRecordSet set;
    set.add("GPS", Record{{"Alt", 123.45}, {"Status", int64_t{3}}});
    set.add("MSG", Record{{"Message", std::string("ArduCopter V4.4.0")}});

    const auto doc = set.to_json();
    ASSERT_TRUE(doc["messages"].isObject());
    EXPECT_DOUBLE_EQ(doc["messages"]["GPS"][0]["Alt"].asDouble(), 123.45);
    EXPECT_EQ(doc["messages"]["GPS"][0]["Status"].asInt(), 3);
    EXPECT_EQ(doc["messages"]["MSG"][0]["Message"].asString(), "ArduCopter V4.4.0");
}

TEST(Value, TimestampsUseTheFixedFormat)
{
    using namespace std::chrono;
    const Timestamp ts{seconds{1646524882} + microseconds{42}};
    EXPECT_EQ(format_timestamp(ts), "2022-03-06 00:01:22.000042");
    EXPECT_EQ(to_display(ts), "2022-03-06 00:01:22.000042");
    EXPECT_EQ(to_json(FieldValue{ts}).asString(), "2022-03-06 00:01:22.000042");
}

TEST(Value, DisplayAndJsonForScalars)
{
    EXPECT_EQ(to_display(FieldValue{}), "None");
    EXPECT_EQ(to_display(true), "True");
    EXPECT_EQ(to_display(int64_t{-7}), "-7");
    EXPECT_EQ(to_display(std::string("EKF3")), "EKF3");

    EXPECT_TRUE(to_json(FieldValue{}).isNull());
    EXPECT_TRUE(to_json(std::numeric_limits<double>::quiet_NaN()).isNull());
    EXPECT_TRUE(to_json(std::numeric_limits<double>::infinity()).isNull());
}

TEST(Value, SetReplacesExistingField)
{
    Record r{{"A", int64_t{1}}};
    r.set("A", int64_t{2});
    r.set("B", 0.5);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(*r.find("A")), 2);
    EXPECT_TRUE(r.contains("B"));
}
