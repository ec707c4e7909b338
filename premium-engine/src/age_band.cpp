#include "age_band.hpp"
#include <array>
#include <stdexcept>

namespace premium {

namespace {

const std::array<AgeBand, AgeBand::MAX_SCORE> BANDS = {{
    {1, 18, 35},
    {2, 36, 45},
    {3, 46, 55},
    {4, 56, 60},
    {5, 61, 65},
    {6, 66, 70},
    {7, 71, -1},
}};

} // anonymous namespace

std::string AgeBand::label() const {
    if (max_age < 0) {
        return std::to_string(min_age) + "+";
    }
    return std::to_string(min_age) + "-" + std::to_string(max_age);
}

int age_band_score(int age) {
    for (const auto& band : BANDS) {
        if (age >= band.min_age && (band.max_age < 0 || age <= band.max_age)) {
            return band.score;
        }
    }
    return AgeBand::UNRATED_SCORE;
}

AgeBand age_band_for_score(int score) {
    if (!is_rateable(score)) {
        throw std::out_of_range("Age band score " + std::to_string(score) +
                                " must be between 1 and " + std::to_string(AgeBand::MAX_SCORE));
    }
    return BANDS[static_cast<size_t>(score - 1)];
}

} // namespace premium
