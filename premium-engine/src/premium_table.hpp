#ifndef PREMIUM_PREMIUM_TABLE_HPP
#define PREMIUM_PREMIUM_TABLE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace premium {

class TableLoadError : public std::runtime_error {
public:
    explicit TableLoadError(const std::string& message)
        : std::runtime_error(message) {}
};

// One premium: the price for a product code and sum insured at an age band
struct PremiumRate {
    std::string key;  // "<code>:<sumInsured>", see make_rate_key()
    int score;        // age band score, 1..AgeBand::MAX_SCORE
    double premium;

    PremiumRate();
    PremiumRate(const std::string& key_, int score_, double premium_);

    bool operator==(const PremiumRate& other) const;
};

// Product codes are 1-32 characters of [A-Za-z0-9_-]
bool is_valid_product_code(const std::string& code);

// Canonical decimal form of a sum insured: digits only, no leading zeros.
// A zero fraction is accepted ("100000.0") since spreadsheet exports
// produce it. Throws std::invalid_argument for anything else, including 0.
std::string normalize_sum_insured(const std::string& text);

// "<code>:<sumInsured>" using the canonical sum insured
std::string make_rate_key(const std::string& code, const std::string& sum_insured);

// Largest monetary amount accepted, in either direction
constexpr double MAX_AMOUNT = 1e12;

// Parse a monetary amount: optional sign, decimal digits with at most one
// '.', optional exponent ("1.5e2"). Throws std::invalid_argument for
// anything else, including hex and magnitudes above MAX_AMOUNT.
double parse_amount(const std::string& text);

// Text that parse_amount() reads back to exactly the same double
std::string encode_amount(double amount);

// Render a premium rounded to cents: "750" when whole, "812.50" otherwise.
// Throws std::invalid_argument when amount is not finite or above MAX_AMOUNT.
std::string format_premium(double amount);

// Premium rates indexed by (key, score)
class PremiumTable {
public:
    // Throws TableLoadError on an invalid score, a negative premium or a
    // duplicate (key, score)
    void add(const PremiumRate& rate);

    std::optional<double> find(const std::string& key, int score) const;

    size_t size() const { return rates_.size(); }
    bool empty() const { return rates_.empty(); }
    size_t key_count() const { return band_counts_.size(); }
    std::vector<std::string> keys() const;

    const std::vector<PremiumRate>& rates() const { return rates_; }

    // Build from the rows of the premium matrix worksheet:
    //   A = product code, B = sum insured, C = band label (ignored), D = premium
    // Rows of one key are listed in age band order, so the n-th row of a key
    // is band n. A leading header row (non-numeric premium) and blank rows
    // are skipped.
    static PremiumTable from_matrix_rows(const std::vector<std::vector<std::string>>& rows);

private:
    std::vector<PremiumRate> rates_;
    std::map<std::pair<std::string, int>, size_t> index_;
    std::map<std::string, int> band_counts_;
};

} // namespace premium

#endif // PREMIUM_PREMIUM_TABLE_HPP
