#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "pipeline/prompts.hpp"
#include "test_support.hpp"

using namespace fchat;
using namespace fchat::pipeline;

TEST(ParseSelection, ReadsPlainArray)
{
    const auto sel = parse_selection(
        R"([{"message_type":"GPS","required_fields":["Alt"]},{"message_type":"ATT","required_fields":[]}])");
    ASSERT_EQ(sel.size(), 2u);
    EXPECT_EQ(sel[0], (Selection{"GPS", {"Alt"}}));
    EXPECT_EQ(sel[1], (Selection{"ATT", {}}));
}

TEST(ParseSelection, ToleratesCodeFenceAndProse)
{
    const auto sel = parse_selection(
        "Here you go:\n```json\n[\n  {\"message_type\": \"BAT\", \"required_fields\": [\"Volt\", \"Curr\"]}\n]\n```\n");
    ASSERT_EQ(sel.size(), 1u);
    EXPECT_EQ(sel[0].message_type, "BAT");
    EXPECT_EQ(sel[0].required_fields, (std::vector<std::string>{"Volt", "Curr"}));
}

TEST(ParseSelection, DropsIncompleteItems)
{
    const auto sel = parse_selection(
        R"([{"message_type":"GPS"},{"required_fields":["Alt"]},"ATT",{"message_type":"ATT","required_fields":["Roll"]}])");
    ASSERT_EQ(sel.size(), 1u);
    EXPECT_EQ(sel[0].message_type, "ATT");
}

TEST(ParseSelection, EmptyArrayIsAValidAnswer)
{
    EXPECT_TRUE(parse_selection("[]").empty());
}

TEST(ParseSelection, NoArrayIsACollaboratorFailure)
{
    EXPECT_THROW(parse_selection("I am not sure which messages you need."), CollaboratorFailure);
    EXPECT_THROW(parse_selection("[{\"message_type\": }]"), CollaboratorFailure);
}

TEST(Prompts, FormatHistory)
{
    EXPECT_EQ(format_history({}), "No history");
    EXPECT_EQ(format_history({{"user", "hi"}, {"assistant", "hello"}}),
              "user: hi\nassistant: hello");
}

TEST(Prompts, AnalyzePromptListsCandidatesAndQuery)
{
    const auto p = build_analyze_prompt("what was the max altitude",
                                        {test::gps_schema()}, {});
    EXPECT_NE(p.find("what was the max altitude"), std::string::npos);
    EXPECT_NE(p.find("### GPS ###"), std::string::npos);
    EXPECT_NE(p.find("Alt (m): Altitude"), std::string::npos);
    EXPECT_NE(p.find("No history"), std::string::npos);
}

TEST(Prompts, AnswerContextShowsSamplesCount)
{
    PipelineState s;
    s.query = "max altitude?";
    ScopedData gps{test::gps_schema(), {}};
    for (int i = 0; i < 5; ++i)
        gps.records.push_back(core::Record{{"Alt", 10.0 * i}});
    s.fetched.emplace_back("GPS", gps);
    s.fetched.emplace_back("XYZ", ScopedData{core::schema_not_found("XYZ"), {}});

    const auto c = build_answer_context(s, 3);
    EXPECT_NE(c.find("# No conversation history"), std::string::npos);
    EXPECT_NE(c.find("## GPS Schema"), std::string::npos);
    EXPECT_NE(c.find("showing 3 of 5 entries"), std::string::npos);
    EXPECT_NE(c.find("Sample 3:\n  Alt: 20"), std::string::npos);
    EXPECT_EQ(c.find("Sample 4:"), std::string::npos);
    EXPECT_NE(c.find("Description: Schema not found"), std::string::npos);
    EXPECT_NE(c.find("No data available for this message type"), std::string::npos);

    EXPECT_NE(build_answer_prompt(c).find(c), std::string::npos);
}
