#ifndef PREMIUM_AGE_BAND_HPP
#define PREMIUM_AGE_BAND_HPP

#include <string>

namespace premium {

// Age bands used by the premium matrix. Each band is identified by a score
// from 1 (youngest adults) to MAX_SCORE (over 70). Ages below MIN_AGE have
// score 0 and cannot be rated.
struct AgeBand {
    static constexpr int UNRATED_SCORE = 0;
    static constexpr int MAX_SCORE = 7;
    static constexpr int MIN_AGE = 18;

    int score;
    int min_age;
    int max_age;  // inclusive; -1 for the open-ended top band

    std::string label() const;
};

// Score of the band containing age, or AgeBand::UNRATED_SCORE
int age_band_score(int age);

// Band definition for a score in 1..MAX_SCORE.
// Throws std::out_of_range for any other score.
AgeBand age_band_for_score(int score);

inline bool is_rateable(int score) {
    return score >= 1 && score <= AgeBand::MAX_SCORE;
}

} // namespace premium

#endif // PREMIUM_AGE_BAND_HPP
