#include <gtest/gtest.h>
#include <core/terms.hpp>

static std::tm make_date(int year, int month, int day) {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    return tm;
}

TEST(Terms, CurrentTermSpring) {
    EXPECT_EQ(current_term(make_date(2026, 1, 10)), "202601");
    EXPECT_EQ(current_term(make_date(2026, 5, 31)), "202601");
}

TEST(Terms, CurrentTermSummer) {
    EXPECT_EQ(current_term(make_date(2026, 6, 1)), "202605");
    EXPECT_EQ(current_term(make_date(2026, 7, 31)), "202605");
}

TEST(Terms, CurrentTermFall) {
    EXPECT_EQ(current_term(make_date(2026, 8, 1)), "202608");
    EXPECT_EQ(current_term(make_date(2026, 11, 30)), "202608");
}

TEST(Terms, DecemberIsNextYearsWinter) {
    EXPECT_EQ(current_term(make_date(2026, 12, 15)), "202712");
}

TEST(Terms, AvailableTermsOrder) {
    auto terms = available_terms(2026);
    ASSERT_EQ(terms.size(), 4u);
    EXPECT_EQ(terms[0].id, "202605");
    EXPECT_EQ(terms[1].id, "202608");
    EXPECT_EQ(terms[2].id, "202712");
    EXPECT_EQ(terms[3].id, "202701");
    EXPECT_EQ(terms[1].label, "Fall 2026");
    EXPECT_EQ(terms[3].label, "Spring 2027");
}

TEST(Terms, ListTermsIncludesCurrentYear) {
    auto listing = list_terms();
    EXPECT_EQ(listing.terms.size(), 4u);
    EXPECT_TRUE(is_valid_term(listing.current));
}

TEST(Terms, Validity) {
    EXPECT_TRUE(is_valid_term("202608"));
    EXPECT_TRUE(is_valid_term("202712"));
    EXPECT_FALSE(is_valid_term("202603"));
    EXPECT_FALSE(is_valid_term("2026"));
    EXPECT_FALSE(is_valid_term("2026ab"));
    EXPECT_FALSE(is_valid_term(""));
}

TEST(Terms, Labels) {
    EXPECT_EQ(term_label("202608"), "Fall 2026");
    EXPECT_EQ(term_label("202605"), "Summer 2026");
    EXPECT_EQ(term_label("202712"), "Winter 2027");
    EXPECT_EQ(term_label("bogus"), "bogus");
}
