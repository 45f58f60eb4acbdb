#include <gtest/gtest.h>
#include <catalog/course_section.hpp>
#include <catalog/partition.hpp>

static CourseSection make_section(const std::string& code, const std::string& days,
                                  const std::string& time) {
    CourseSection s;
    s.code = code;
    s.section = "0101";
    s.credits = 3;
    s.days = days;
    s.time = time;
    s.term_id = "202608";
    return s;
}

TEST(CourseSection, ParseDaysMwf) {
    std::set<Weekday> expected = {Weekday::Monday, Weekday::Wednesday, Weekday::Friday};
    EXPECT_EQ(parse_days("MWF"), expected);
}

TEST(CourseSection, ParseDaysTuTh) {
    std::set<Weekday> expected = {Weekday::Tuesday, Weekday::Thursday};
    EXPECT_EQ(parse_days("TuTh"), expected);
}

TEST(CourseSection, ParseDaysMw) {
    std::set<Weekday> expected = {Weekday::Monday, Weekday::Wednesday};
    EXPECT_EQ(parse_days("MW"), expected);
}

TEST(CourseSection, ParseDaysWeekend) {
    std::set<Weekday> expected = {Weekday::Saturday, Weekday::Sunday};
    EXPECT_EQ(parse_days("SaSu"), expected);
}

TEST(CourseSection, ParseDaysUnknownTokenIsEmpty) {
    EXPECT_TRUE(parse_days("MXF").empty());
    EXPECT_TRUE(parse_days("TBA").empty());
    EXPECT_TRUE(parse_days("").empty());
}

TEST(CourseSection, MeetingsExpandDays) {
    auto s = make_section("CMSC330", "TuTh", "2:00pm-3:15pm");
    auto m = s.meetings();
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m[0].day, Weekday::Tuesday);
    EXPECT_EQ(m[0].start, 840);
    EXPECT_EQ(m[0].end, 915);
    EXPECT_EQ(m[1].day, Weekday::Thursday);
}

TEST(CourseSection, UnparseableTimeHasNoMeetings) {
    EXPECT_TRUE(make_section("CMSC330", "MWF", "TBA").meetings().empty());
    EXPECT_TRUE(make_section("CMSC330", "", "10:00am-10:50am").meetings().empty());
}

TEST(CourseSection, OverlapOnSharedDayConflicts) {
    auto a = make_section("CMSC101", "M", "10:00am-10:50am");
    auto b = make_section("CMSC101", "M", "10:30am-11:20am");
    EXPECT_TRUE(sections_conflict(a, b));
    EXPECT_TRUE(sections_conflict(b, a));
}

TEST(CourseSection, BackToBackDoesNotConflict) {
    auto a = make_section("CMSC131", "MWF", "10:00am-10:50am");
    auto b = make_section("MATH140", "MWF", "10:50am-11:40am");
    EXPECT_FALSE(sections_conflict(a, b));
}

TEST(CourseSection, SameTimeDifferentDaysDoesNotConflict) {
    auto a = make_section("CMSC131", "MWF", "10:00am-10:50am");
    auto b = make_section("MATH140", "TuTh", "10:00am-10:50am");
    EXPECT_FALSE(sections_conflict(a, b));
}

TEST(CourseSection, TbaNeverConflicts) {
    auto a = make_section("CMSC131", "MWF", "10:00am-10:50am");
    auto b = make_section("CMSC132", "MWF", "TBA");
    EXPECT_FALSE(sections_conflict(a, b));
}

TEST(CourseSection, Identity) {
    auto s = make_section("CMSC330", "MWF", "TBA");
    EXPECT_EQ(s.identity(), "CMSC330-0101@202608");
}

TEST(CourseSection, DepartmentAndLevel) {
    EXPECT_EQ(course_department("CMSC330"), "CMSC");
    EXPECT_EQ(course_department("bsci105"), "BSCI");
    EXPECT_EQ(course_level("CMSC330"), 3);
    EXPECT_EQ(course_level("ENGL101A"), 1);
    EXPECT_EQ(course_level("CMSC"), 0);
}

TEST(Partition, IdFormatting) {
    PartitionId id{PartitionKind::GenEd, "FSOC", "202608"};
    EXPECT_EQ(id.to_string(), "gened:FSOC@202608");
    EXPECT_EQ(id.file_name(), "gened_FSOC_202608.yaml");
}

TEST(Partition, IdOrderingAndEquality) {
    PartitionId a{PartitionKind::Department, "CMSC", "202608"};
    PartitionId b{PartitionKind::Department, "MATH", "202608"};
    PartitionId c{PartitionKind::GenEd, "CMSC", "202608"};
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(a < c);
    EXPECT_TRUE(a != c);
    EXPECT_EQ(a, (PartitionId{PartitionKind::Department, "CMSC", "202608"}));
}

TEST(Partition, ParseKind) {
    EXPECT_EQ(parse_partition_kind("dept"), PartitionKind::Department);
    EXPECT_EQ(parse_partition_kind("GenEd"), PartitionKind::GenEd);
    EXPECT_FALSE(parse_partition_kind("major").has_value());
}

TEST(Partition, GenEdCodes) {
    EXPECT_TRUE(is_gen_ed_code("FSOC"));
    EXPECT_TRUE(is_gen_ed_code("DVUP"));
    EXPECT_FALSE(is_gen_ed_code("CMSC"));
}
