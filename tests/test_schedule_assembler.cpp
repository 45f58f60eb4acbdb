#include <gtest/gtest.h>
#include <planner/schedule_assembler.hpp>
#include <atomic>

static const std::string TERM = "202608";

static CourseSection make_section(const std::string& code, const std::string& sec,
                                  const std::string& days, const std::string& time,
                                  int credits = 3) {
    CourseSection s;
    s.code = code;
    s.section = sec;
    s.credits = credits;
    s.days = days;
    s.time = time;
    s.open_seats = 10;
    s.term_id = TERM;
    return s;
}

static PartitionSnapshot make_partition(PartitionKind kind, const std::string& key,
                                        std::vector<CourseSection> sections) {
    auto p = std::make_shared<CachePartition>();
    p->id = {kind, key, TERM};
    p->sections = std::move(sections);
    return p;
}

static AssemblerOptions pinned_options() {
    AssemblerOptions o;
    o.max_results = 5;
    o.node_budget = 100000;
    o.weights.rating = 1.0;
    o.weights.gpa = 1.0;
    o.weights.compactness = 0.01;
    o.weights.preference_boost = 2.0;
    return o;
}

static void expect_conflict_free(const ScheduleCandidate& c) {
    for (size_t i = 0; i < c.sections.size(); ++i) {
        for (size_t j = i + 1; j < c.sections.size(); ++j) {
            EXPECT_FALSE(sections_conflict(c.sections[i], c.sections[j]))
                << c.sections[i].identity() << " vs " << c.sections[j].identity();
        }
    }
}

TEST(ScheduleAssembler, RequirementSlotOrder) {
    ConstraintSet c;
    c.add_gen_ed("FSOC");
    c.add_department("MATH");
    c.add_course("CMSC330");

    auto slots = requirement_slots(c);
    ASSERT_EQ(slots.size(), 3u);
    EXPECT_EQ(slots[0].label(), "course CMSC330");
    EXPECT_EQ(slots[1].label(), "dept MATH");
    EXPECT_EQ(slots[2].label(), "gen-ed FSOC");

    EXPECT_EQ(slots[0].partition(TERM), (PartitionId{PartitionKind::Department, "CMSC", TERM}));
    EXPECT_EQ(slots[2].partition(TERM), (PartitionId{PartitionKind::GenEd, "FSOC", TERM}));
}

TEST(ScheduleAssembler, ConflictingSectionsOfOneCourse) {
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC101", "0101", "M", "10:00am-10:50am"),
        make_section("CMSC101", "0102", "M", "10:30am-11:20am"),
    });

    ConstraintSet c;
    c.add_course("CMSC101");

    ScheduleAssembler assembler(pinned_options());
    auto result = assembler.assemble(c, {cmsc});

    ASSERT_EQ(result.schedules.size(), 2u);
    EXPECT_EQ(result.complete_found, 2u);
    for (const auto& s : result.schedules) {
        ASSERT_EQ(s.sections.size(), 1u);
        EXPECT_EQ(s.sections[0].code, "CMSC101");
    }
    EXPECT_NE(result.schedules[0].sections[0].section, result.schedules[1].sections[0].section);
}

TEST(ScheduleAssembler, CreditTargetSelectsExactTotal) {
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC131", "0101", "MWF", "9:00am-9:50am", 3),
        make_section("CMSC132", "0101", "MWF", "1:00pm-1:50pm", 4),
    });
    auto fsoc = make_partition(PartitionKind::GenEd, "FSOC", {
        make_section("COMM107", "0101", "TuTh", "11:00am-12:15pm", 3),
    });

    ConstraintSet c;
    c.add_department("CMSC");
    c.add_gen_ed("FSOC");
    c.credits.min = 6;
    c.credits.max = 6;

    ScheduleAssembler assembler(pinned_options());
    auto result = assembler.assemble(c, {cmsc, fsoc});

    ASSERT_EQ(result.schedules.size(), 1u);
    const auto& s = result.schedules[0];
    EXPECT_EQ(s.total_credits, 6);
    ASSERT_EQ(s.sections.size(), 2u);
    EXPECT_EQ(s.sections[0].code, "CMSC131");
    EXPECT_EQ(s.sections[1].code, "COMM107");
}

TEST(ScheduleAssembler, NoReturnedScheduleHasConflicts) {
    std::vector<CourseSection> math, hist, engl;
    const char* times[] = {"9:00am-9:50am", "9:30am-10:20am", "10:00am-10:50am", "11:00am-11:50am"};
    for (int i = 0; i < 4; ++i) {
        math.push_back(make_section("MATH14" + std::to_string(i), "0101", "MWF", times[i]));
        hist.push_back(make_section("HIST20" + std::to_string(i), "0101", "MW", times[(i + 1) % 4]));
        engl.push_back(make_section("ENGL10" + std::to_string(i), "0101", "MF", times[(i + 2) % 4]));
    }

    ConstraintSet c;
    c.add_department("MATH");
    c.add_department("HIST");
    c.add_department("ENGL");

    AssemblerOptions o = pinned_options();
    o.max_results = 50;
    ScheduleAssembler assembler(o);
    auto result = assembler.assemble(c, {
        make_partition(PartitionKind::Department, "MATH", math),
        make_partition(PartitionKind::Department, "HIST", hist),
        make_partition(PartitionKind::Department, "ENGL", engl),
    });

    ASSERT_FALSE(result.schedules.empty());
    for (const auto& s : result.schedules) {
        EXPECT_EQ(s.sections.size(), 3u);
        expect_conflict_free(s);
    }
}

TEST(ScheduleAssembler, DeterministicOrderAndScores) {
    std::vector<CourseSection> sections;
    for (int i = 0; i < 6; ++i) {
        auto s = make_section("CMSC2" + std::to_string(10 + i), "0101",
                              i % 2 ? "TuTh" : "MWF",
                              i < 3 ? "9:00am-9:50am" : "2:00pm-2:50pm");
        s.instructor_rating = 3.0 + 0.25 * i;
        sections.push_back(s);
    }
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", sections);

    ConstraintSet c;
    c.add_department("CMSC");
    c.add_course("CMSC215");

    ScheduleAssembler assembler(pinned_options());
    auto first = assembler.assemble(c, {cmsc});
    auto second = assembler.assemble(c, {cmsc});

    ASSERT_EQ(first.schedules.size(), second.schedules.size());
    ASSERT_FALSE(first.schedules.empty());
    for (size_t i = 0; i < first.schedules.size(); ++i) {
        EXPECT_EQ(first.schedules[i].key(), second.schedules[i].key());
        EXPECT_DOUBLE_EQ(first.schedules[i].score, second.schedules[i].score);
    }
    for (size_t i = 1; i < first.schedules.size(); ++i) {
        EXPECT_GE(first.schedules[i - 1].score, first.schedules[i].score);
    }
}

TEST(ScheduleAssembler, RankedByRatingThenDistinct) {
    auto low = make_section("HIST200", "0101", "MWF", "9:00am-9:50am");
    low.instructor_rating = 2.5;
    auto high = make_section("HIST210", "0101", "MWF", "9:00am-9:50am");
    high.instructor_rating = 4.5;
    auto mid = make_section("HIST220", "0101", "MWF", "9:00am-9:50am");
    mid.instructor_rating = 3.5;

    // The duplicate row must not produce a second identical schedule
    auto hist = make_partition(PartitionKind::Department, "HIST", {low, high, mid, high});

    ConstraintSet c;
    c.add_department("HIST");

    AssemblerOptions o = pinned_options();
    o.max_results = 2;
    auto result = ScheduleAssembler(o).assemble(c, {hist});

    ASSERT_EQ(result.schedules.size(), 2u);
    EXPECT_EQ(result.schedules[0].sections[0].code, "HIST210");
    EXPECT_EQ(result.schedules[1].sections[0].code, "HIST220");
    EXPECT_EQ(result.pool_sizes, std::vector<size_t>{3});
}

TEST(ScheduleAssembler, ScoreUsesPresentValuesOnly) {
    auto a = make_section("MATH140", "0101", "M", "9:00am-9:50am");
    a.instructor_rating = 4.0;
    a.course_gpa = 3.0;
    auto b = make_section("HIST200", "0101", "M", "11:00am-11:50am");
    b.instructor_rating = 2.0;

    ScheduleCandidate candidate;
    candidate.sections = {a, b};

    ScheduleAssembler assembler(pinned_options());
    assembler.score(candidate, RankingPreference::Balanced);

    EXPECT_EQ(candidate.total_credits, 6);
    EXPECT_DOUBLE_EQ(candidate.avg_rating, 3.0);
    EXPECT_DOUBLE_EQ(candidate.avg_gpa, 3.0);
    EXPECT_EQ(candidate.idle_minutes, 70);
    EXPECT_DOUBLE_EQ(candidate.score, 3.0 + 3.0 - 0.7);

    assembler.score(candidate, RankingPreference::MinimizeGaps);
    EXPECT_DOUBLE_EQ(candidate.score, 3.0 + 3.0 - 1.4);
}

TEST(ScheduleAssembler, IdleGapsOnlyCountSharedDays) {
    auto a = make_section("MATH140", "0101", "MW", "9:00am-9:50am");
    auto b = make_section("HIST200", "0101", "M", "10:00am-10:50am");
    auto c = make_section("ENGL101", "0101", "W", "1:00pm-1:50pm");
    auto d = make_section("ARTT100", "0101", "F", "9:00am-9:50am");
    EXPECT_EQ(idle_gap_minutes({&a, &b, &c, &d}), 10 + 190);
}

TEST(ScheduleAssembler, CompactScheduleRanksFirst) {
    auto anchor = make_section("MATH140", "0101", "M", "9:00am-9:50am");
    auto near = make_section("HIST200", "0101", "M", "10:00am-10:50am");
    auto far = make_section("HIST210", "0101", "M", "3:00pm-3:50pm");

    ConstraintSet c;
    c.add_course("MATH140");
    c.add_department("HIST");

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {
        make_partition(PartitionKind::Department, "MATH", {anchor}),
        make_partition(PartitionKind::Department, "HIST", {far, near}),
    });

    ASSERT_EQ(result.schedules.size(), 2u);
    EXPECT_EQ(result.schedules[0].sections[1].code, "HIST200");
    EXPECT_LT(result.schedules[0].idle_minutes, result.schedules[1].idle_minutes);
}

TEST(ScheduleAssembler, SameCourseNeverTwice) {
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC131", "0101", "MWF", "9:00am-9:50am"),
    });
    auto dsns = make_partition(PartitionKind::GenEd, "DSNS", {
        make_section("CMSC131", "0201", "TuTh", "9:30am-10:45am"),
        make_section("BSCI105", "0101", "TuTh", "11:00am-12:15pm"),
    });

    ConstraintSet c;
    c.add_department("CMSC");
    c.add_gen_ed("DSNS");

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {cmsc, dsns});
    ASSERT_EQ(result.schedules.size(), 1u);
    EXPECT_EQ(result.schedules[0].sections[1].code, "BSCI105");
}

TEST(ScheduleAssembler, RequestedCourseStaysOutOfDepartmentPool) {
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC330", "0101", "MWF", "9:00am-9:50am"),
        make_section("CMSC351", "0101", "TuTh", "9:30am-10:45am"),
    });

    ConstraintSet c;
    c.add_course("CMSC330");
    c.add_department("CMSC");

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {cmsc});
    EXPECT_EQ(result.pool_sizes, (std::vector<size_t>{1, 1}));
    ASSERT_EQ(result.schedules.size(), 1u);
}

TEST(ScheduleAssembler, KeywordsNarrowDepartmentPool) {
    auto ml = make_section("CMSC422", "0101", "TuTh", "2:00pm-3:15pm");
    ml.title = "Machine Learning";
    auto os = make_section("CMSC412", "0101", "MW", "2:00pm-3:15pm");
    os.title = "Operating Systems";
    auto compilers = make_section("CMSC430", "0101", "MW", "9:00am-9:50am");
    compilers.title = "Compilers";

    ConstraintSet c;
    c.add_course("CMSC430");
    c.add_department("CMSC");
    c.keywords = {"machine learning"};

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {
        make_partition(PartitionKind::Department, "CMSC", {ml, os, compilers}),
    });
    // The requested course stays in its slot though its title is off topic
    EXPECT_EQ(result.pool_sizes, (std::vector<size_t>{1, 1}));
    ASSERT_EQ(result.schedules.size(), 1u);
    EXPECT_EQ(result.schedules[0].sections[1].code, "CMSC422");
}

TEST(ScheduleAssembler, KeywordsWithNoMatchKeepWholePool) {
    auto a = make_section("HIST200", "0101", "MW", "9:00am-9:50am");
    a.title = "American History";
    auto b = make_section("HIST210", "0101", "TuTh", "9:00am-9:50am");
    b.title = "European History";

    ConstraintSet c;
    c.add_department("HIST");
    c.keywords = {"robotics"};

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {
        make_partition(PartitionKind::Department, "HIST", {a, b}),
    });
    EXPECT_EQ(result.pool_sizes, std::vector<size_t>{2});
    EXPECT_EQ(result.schedules.size(), 2u);
}

TEST(ScheduleAssembler, FiltersApplyToPools) {
    auto fri = make_section("MATH140", "0101", "MWF", "9:00am-9:50am");
    auto tuth = make_section("MATH141", "0101", "TuTh", "9:30am-10:45am");
    auto full = make_section("MATH240", "0101", "TuTh", "2:00pm-3:15pm");
    full.open_seats = 0;
    auto upper = make_section("MATH410", "0101", "TuTh", "3:30pm-4:45pm");
    auto taken = make_section("MATH246", "0101", "TuTh", "5:00pm-6:15pm");

    ConstraintSet c;
    c.add_department("MATH");
    c.excluded_days = {Weekday::Friday};
    c.open_seats_only = true;
    c.level_max = 2;
    c.excluded_courses = {"MATH246"};

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {
        make_partition(PartitionKind::Department, "MATH", {fri, tuth, full, upper, taken}),
    });
    ASSERT_EQ(result.schedules.size(), 1u);
    EXPECT_EQ(result.schedules[0].sections[0].code, "MATH141");
}

TEST(ScheduleAssembler, UnparseableTimeIsSchedulable) {
    auto fixed = make_section("MATH140", "0101", "MWF", "9:00am-9:50am");
    auto tba = make_section("HIST200", "0101", "TBA", "TBA");

    ConstraintSet c;
    c.add_department("MATH");
    c.add_department("HIST");
    c.excluded_days = {Weekday::Monday, Weekday::Tuesday};

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {
        make_partition(PartitionKind::Department, "MATH", {fixed}),
        make_partition(PartitionKind::Department, "HIST", {tba}),
    });
    // MATH140 meets Monday and is filtered; the TBA section alone cannot fill MATH
    EXPECT_TRUE(result.schedules.empty());

    c.excluded_days.clear();
    auto ok = ScheduleAssembler(pinned_options()).assemble(c, {
        make_partition(PartitionKind::Department, "MATH", {fixed}),
        make_partition(PartitionKind::Department, "HIST", {tba}),
    });
    ASSERT_EQ(ok.schedules.size(), 1u);
    EXPECT_EQ(ok.schedules[0].idle_minutes, 0);
}

TEST(ScheduleAssembler, EmptyConstraintsYieldNothing) {
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC131", "0101", "MWF", "9:00am-9:50am"),
    });
    auto result = ScheduleAssembler(pinned_options()).assemble(ConstraintSet{}, {cmsc});
    EXPECT_TRUE(result.schedules.empty());
    EXPECT_TRUE(result.slots.empty());
    EXPECT_EQ(result.nodes_visited, 0);
}

TEST(ScheduleAssembler, MissingPartitionYieldsEmptyPool) {
    ConstraintSet c;
    c.add_department("CMSC");
    c.add_gen_ed("FSOC");

    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC131", "0101", "MWF", "9:00am-9:50am"),
    });
    auto result = ScheduleAssembler(pinned_options()).assemble(c, {cmsc});
    EXPECT_TRUE(result.schedules.empty());
    EXPECT_EQ(result.pool_sizes, (std::vector<size_t>{1, 0}));
}

TEST(ScheduleAssembler, NodeBudgetStopsSearch) {
    std::vector<CourseSection> a, b, c;
    for (int i = 0; i < 20; ++i) {
        a.push_back(make_section("MATH1" + std::to_string(10 + i), "0101", "TBA", "TBA"));
        b.push_back(make_section("HIST2" + std::to_string(10 + i), "0101", "TBA", "TBA"));
        c.push_back(make_section("ENGL3" + std::to_string(10 + i), "0101", "TBA", "TBA"));
    }

    ConstraintSet cs;
    cs.add_department("MATH");
    cs.add_department("HIST");
    cs.add_department("ENGL");

    AssemblerOptions o = pinned_options();
    o.node_budget = 100;
    auto result = ScheduleAssembler(o).assemble(cs, {
        make_partition(PartitionKind::Department, "MATH", a),
        make_partition(PartitionKind::Department, "HIST", b),
        make_partition(PartitionKind::Department, "ENGL", c),
    });

    EXPECT_TRUE(result.partial_search);
    EXPECT_EQ(result.nodes_visited, 100);
    EXPECT_FALSE(result.schedules.empty());
    EXPECT_LE(result.schedules.size(), 5u);
}

TEST(ScheduleAssembler, FullSearchIsNotPartial) {
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC131", "0101", "MWF", "9:00am-9:50am"),
        make_section("CMSC132", "0101", "MWF", "10:00am-10:50am"),
    });
    ConstraintSet c;
    c.add_department("CMSC");

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {cmsc});
    EXPECT_FALSE(result.partial_search);
    EXPECT_EQ(result.nodes_visited, 2);
}

TEST(ScheduleAssembler, CancelledBeforeFirstStep) {
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC131", "0101", "MWF", "9:00am-9:50am"),
    });
    ConstraintSet c;
    c.add_department("CMSC");

    std::atomic<bool> cancel{true};
    AssemblerOptions o = pinned_options();
    o.cancel = &cancel;
    auto result = ScheduleAssembler(o).assemble(c, {cmsc});

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.schedules.empty());
    EXPECT_EQ(result.nodes_visited, 0);
}

TEST(ScheduleAssembler, UnreachableMinimumPrunes) {
    auto cmsc = make_partition(PartitionKind::Department, "CMSC", {
        make_section("CMSC131", "0101", "MWF", "9:00am-9:50am", 4),
    });
    auto math = make_partition(PartitionKind::Department, "MATH", {
        make_section("MATH140", "0101", "TuTh", "9:30am-10:45am", 4),
    });

    ConstraintSet c;
    c.add_department("CMSC");
    c.add_department("MATH");
    c.credits.min = 12;

    auto result = ScheduleAssembler(pinned_options()).assemble(c, {cmsc, math});
    EXPECT_TRUE(result.schedules.empty());
    EXPECT_EQ(result.nodes_visited, 1);
}
