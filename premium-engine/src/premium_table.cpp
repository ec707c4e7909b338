#include "premium_table.hpp"
#include "age_band.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace premium {

namespace {

constexpr size_t MAX_CODE_LENGTH = 32;

constexpr size_t CODE_COLUMN = 0;
constexpr size_t SUM_INSURED_COLUMN = 1;
constexpr size_t PREMIUM_COLUMN = 3;

std::string cell(const std::vector<std::string>& row, size_t column) {
    if (column >= row.size()) {
        return "";
    }
    const std::string& value = row[column];
    auto start = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool is_blank_row(const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
        if (!cell(row, i).empty()) {
            return false;
        }
    }
    return true;
}

size_t skip_digits(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

bool is_decimal_number(const std::string& text) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        ++pos;
    }

    size_t int_end = skip_digits(text, pos);
    size_t mantissa_digits = int_end - pos;
    pos = int_end;
    if (pos < text.size() && text[pos] == '.') {
        size_t frac_end = skip_digits(text, pos + 1);
        mantissa_digits += frac_end - (pos + 1);
        pos = frac_end;
    }
    if (mantissa_digits == 0) {
        return false;
    }

    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            ++pos;
        }
        size_t exp_end = skip_digits(text, pos);
        if (exp_end == pos) {
            return false;
        }
        pos = exp_end;
    }
    return pos == text.size();
}

bool is_numeric(const std::string& text) {
    try {
        parse_amount(text);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

} // anonymous namespace

PremiumRate::PremiumRate()
    : score(0), premium(0.0) {}

PremiumRate::PremiumRate(const std::string& key_, int score_, double premium_)
    : key(key_), score(score_), premium(premium_) {}

bool PremiumRate::operator==(const PremiumRate& other) const {
    return key == other.key && score == other.score && premium == other.premium;
}

bool is_valid_product_code(const std::string& code) {
    if (code.empty() || code.size() > MAX_CODE_LENGTH) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

std::string normalize_sum_insured(const std::string& text) {
    std::string digits = text;

    size_t dot = digits.find('.');
    if (dot != std::string::npos) {
        std::string fraction = digits.substr(dot + 1);
        if (fraction.empty() ||
            !std::all_of(fraction.begin(), fraction.end(), [](char c) { return c == '0'; })) {
            throw std::invalid_argument("Sum insured '" + text + "' must be a whole amount");
        }
        digits.erase(dot);
    }

    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Sum insured '" + text + "' must contain only digits");
    }

    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        throw std::invalid_argument("Sum insured must be greater than zero");
    }
    return digits.substr(first);
}

std::string make_rate_key(const std::string& code, const std::string& sum_insured) {
    return code + ":" + normalize_sum_insured(sum_insured);
}

double parse_amount(const std::string& text) {
    if (!is_decimal_number(text)) {
        throw std::invalid_argument("Amount '" + text + "' is not a number");
    }

    double value = 0.0;
    try {
        value = std::stod(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Amount '" + text + "' is out of range");
    }

    if (!std::isfinite(value) || std::fabs(value) > MAX_AMOUNT) {
        throw std::invalid_argument("Amount '" + text + "' is out of range");
    }
    return value;
}

std::string encode_amount(double amount) {
    std::ostringstream oss;
    oss.precision(17);
    oss << amount;
    return oss.str();
}

std::string format_premium(double amount) {
    if (!std::isfinite(amount) || std::fabs(amount) > MAX_AMOUNT) {
        throw std::invalid_argument("Premium out of range");
    }
    double cents = std::round(amount * 100.0);

    std::ostringstream oss;
    if (std::fmod(cents, 100.0) == 0.0) {
        oss << std::fixed << std::setprecision(0) << cents / 100.0;
    } else {
        oss << std::fixed << std::setprecision(2) << cents / 100.0;
    }
    return oss.str();
}

void PremiumTable::add(const PremiumRate& rate) {
    if (!is_rateable(rate.score)) {
        throw TableLoadError("Rate for " + rate.key + " has invalid age band score " +
                             std::to_string(rate.score));
    }
    if (rate.premium < 0.0) {
        throw TableLoadError("Rate for " + rate.key + " has a negative premium");
    }
    if (!std::isfinite(rate.premium) || rate.premium > MAX_AMOUNT) {
        throw TableLoadError("Rate for " + rate.key + " has a premium above " +
                             format_premium(MAX_AMOUNT));
    }

    auto index_key = std::make_pair(rate.key, rate.score);
    if (index_.count(index_key) > 0) {
        throw TableLoadError("Duplicate rate for " + rate.key + " in age band " +
                             std::to_string(rate.score));
    }

    index_[index_key] = rates_.size();
    rates_.push_back(rate);

    int& bands = band_counts_[rate.key];
    bands = std::max(bands, rate.score);
}

std::optional<double> PremiumTable::find(const std::string& key, int score) const {
    auto it = index_.find(std::make_pair(key, score));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return rates_[it->second].premium;
}

std::vector<std::string> PremiumTable::keys() const {
    std::vector<std::string> result;
    result.reserve(band_counts_.size());
    for (const auto& [key, bands] : band_counts_) {
        result.push_back(key);
    }
    return result;
}

PremiumTable PremiumTable::from_matrix_rows(const std::vector<std::vector<std::string>>& rows) {
    PremiumTable table;
    std::map<std::string, int> next_score;
    bool first_row = true;

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        const std::string where = "Row " + std::to_string(i + 1);

        if (is_blank_row(row)) {
            continue;
        }

        std::string code = cell(row, CODE_COLUMN);
        std::string sum_insured = cell(row, SUM_INSURED_COLUMN);
        std::string premium_text = cell(row, PREMIUM_COLUMN);

        if (first_row) {
            first_row = false;
            if (!is_numeric(premium_text)) {
                continue;  // header
            }
        }

        if (code.empty() || sum_insured.empty() || premium_text.empty()) {
            throw TableLoadError(where + ": product code, sum insured and premium are required");
        }
        if (!is_valid_product_code(code)) {
            throw TableLoadError(where + ": invalid product code '" + code + "'");
        }

        std::string key;
        double premium = 0.0;
        try {
            key = make_rate_key(code, sum_insured);
            premium = parse_amount(premium_text);
        } catch (const std::invalid_argument& e) {
            throw TableLoadError(where + ": " + e.what());
        }

        int score = ++next_score[key];
        if (score > AgeBand::MAX_SCORE) {
            throw TableLoadError(where + ": " + key + " has more than " +
                                 std::to_string(AgeBand::MAX_SCORE) + " age bands");
        }

        try {
            table.add(PremiumRate(key, score, premium));
        } catch (const TableLoadError& e) {
            throw TableLoadError(where + ": " + e.what());
        }
    }

    return table;
}

} // namespace premium
