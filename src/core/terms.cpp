#include "terms.hpp"
#include "constants.hpp"
#include <fmt/format.h>
#include <cctype>

std::string current_term(const std::tm& date) {
    int year = date.tm_year + 1900;
    int month = date.tm_mon + 1;

    const char* season;
    if (month <= 5) {
        season = TERM_SPRING;
    } else if (month <= 7) {
        season = TERM_SUMMER;
    } else if (month <= 11) {
        season = TERM_FALL;
    } else {
        season = TERM_WINTER;
        year += 1;  // December belongs to next year's winter session
    }
    return fmt::format("{}{}", year, season);
}

std::string current_term() {
    std::time_t t = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return current_term(tm_buf);
}

std::vector<TermInfo> available_terms(int year) {
    std::vector<TermInfo> terms;
    for (const auto& id : {fmt::format("{}{}", year, TERM_SUMMER),
                           fmt::format("{}{}", year, TERM_FALL),
                           fmt::format("{}{}", year + 1, TERM_WINTER),
                           fmt::format("{}{}", year + 1, TERM_SPRING)}) {
        terms.push_back({id, term_label(id)});
    }
    return terms;
}

TermListing list_terms() {
    std::time_t t = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    TermListing listing;
    listing.terms = available_terms(tm_buf.tm_year + 1900);
    listing.current = current_term(tm_buf);
    return listing;
}

bool is_valid_term(const std::string& term_id) {
    if (term_id.size() != 6) return false;
    for (char c : term_id) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    std::string season = term_id.substr(4);
    return season == TERM_SPRING || season == TERM_SUMMER ||
           season == TERM_FALL || season == TERM_WINTER;
}

std::string term_label(const std::string& term_id) {
    if (!is_valid_term(term_id)) return term_id;

    std::string year = term_id.substr(0, 4);
    std::string season = term_id.substr(4);
    if (season == TERM_SPRING) return "Spring " + year;
    if (season == TERM_SUMMER) return "Summer " + year;
    if (season == TERM_FALL) return "Fall " + year;
    return "Winter " + year;
}
