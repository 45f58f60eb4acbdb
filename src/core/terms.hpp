#pragma once

#include <string>
#include <vector>
#include <ctime>

// Academic term ids are YYYYMM where MM is 01 (spring), 05 (summer),
// 08 (fall) or 12 (winter). Winter YYYY12 is the session that opens in
// December of YYYY-1 and is labelled with its calendar year.
struct TermInfo {
    std::string id;
    std::string label;  // e.g. "Fall 2026"
};

struct TermListing {
    std::vector<TermInfo> terms;
    std::string current;
};

// Term in session on the given local date.
std::string current_term(const std::tm& date);
std::string current_term();

// Summer and fall of `year`, then winter and spring of the following year.
std::vector<TermInfo> available_terms(int year);

// Known terms for the current year plus the current term id.
TermListing list_terms();

bool is_valid_term(const std::string& term_id);

// "202608" -> "Fall 2026". Unknown ids are returned unchanged.
std::string term_label(const std::string& term_id);
