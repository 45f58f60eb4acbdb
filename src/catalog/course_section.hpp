#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>

enum class Weekday { Monday, Tuesday, Wednesday, Thursday, Friday, Saturday, Sunday };

// One block of class time: [start, end) in minutes since midnight.
struct Meeting {
    Weekday day;
    int start;
    int end;
};

struct CourseSection {
    std::string code;                        // department + number, e.g. "CMSC330"
    std::string section;                     // e.g. "0101"
    std::string title;
    std::string description;
    int credits = 0;
    std::string instructor;
    std::optional<double> instructor_rating; // 0-5
    std::optional<double> course_gpa;        // 0-4
    int open_seats = 0;
    int total_seats = 0;
    std::string location;
    std::string days;                        // compact pattern, e.g. "MWF", "TuTh"
    std::string time;                        // e.g. "10:00am-10:50am"
    std::set<std::string> gen_eds;
    std::string term_id;

    // (code, section, term_id) rendered as "CMSC330-0101@202608"
    std::string identity() const;

    // Meeting blocks resolved from days + time. Empty when either does not
    // parse; such a section has no fixed meeting and never conflicts.
    std::vector<Meeting> meetings() const;
};

// "MWF" -> {Mon, Wed, Fri}; "TuTh" -> {Tue, Thu}. An unrecognized token
// makes the whole pattern unparseable and yields an empty set.
std::set<Weekday> parse_days(const std::string& pattern);

// Short token for a day ("M", "Tu", ...).
const char* weekday_token(Weekday day);

// Two sections conflict when they share a day and their [start, end)
// intervals overlap on that day.
bool meetings_conflict(const std::vector<Meeting>& a, const std::vector<Meeting>& b);
bool sections_conflict(const CourseSection& a, const CourseSection& b);

// "CMSC330" -> "CMSC"
std::string course_department(const std::string& code);

// "CMSC330" -> 3. Returns 0 when the code carries no number.
int course_level(const std::string& code);
