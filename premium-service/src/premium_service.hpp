/**
 * @file premium_service.hpp
 * @brief Premium rating facade used by the HTTP router
 *
 * The service ties the rating engine to a rate store:
 * - calculate_premium(): validate input, derive the age band, look up the rate
 * - load_tables(): read the premium matrix and replace the stored rates
 * - unload_tables() / tables_loaded(): manage the stored rates
 *
 * Every failure leaves as a PremiumError; engine and store exceptions are
 * logged here and translated.
 */

#ifndef PREMIUM_PREMIUM_SERVICE_HPP
#define PREMIUM_PREMIUM_SERVICE_HPP

#include "errors.hpp"
#include "store/premium_store.hpp"
#include "../../premium-engine/src/date.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace premium {

/**
 * @brief Quote request as received from clients
 */
struct QuoteRequest {
    std::string code;            ///< Product code, e.g. "1A"
    std::string sum_insured;     ///< Decimal digits, e.g. "100000"
    std::string date_of_birth;   ///< "YYYY-MM-DD"

    QuoteRequest() = default;
    QuoteRequest(const std::string& code_, const std::string& sum_insured_,
                 const std::string& date_of_birth_)
        : code(code_), sum_insured(sum_insured_), date_of_birth(date_of_birth_) {}
};

/**
 * @brief Result of a successful quote
 */
struct Quote {
    std::string rate_key;        ///< "<code>:<sumInsured>"
    int age;                     ///< Completed years on the quote date
    int score;                   ///< Age band score 1..7
    double premium;

    Quote() : age(0), score(0), premium(0.0) {}

    /**
     * @brief Premium as sent to clients ("750", "812.50")
     */
    std::string premium_text() const;
};

/**
 * @brief Location of the premium matrix
 */
struct TableSource {
    std::string path;            ///< .xlsx or .csv file
    std::string sheet;           ///< Worksheet name (xlsx only)

    TableSource() : sheet("matrix") {}
    TableSource(const std::string& path_, const std::string& sheet_)
        : path(path_), sheet(sheet_) {}
};

/**
 * @brief Outcome of load_tables()
 */
struct LoadSummary {
    size_t rows;                 ///< Rates written
    size_t keys;                 ///< Distinct rate keys written
    std::string path;
    std::string sheet;
    double duration_ms;

    LoadSummary() : rows(0), keys(0), duration_ms(0.0) {}
};

/**
 * @brief Premium rating service
 *
 * Thread-safe to the extent of its store; the service itself holds no
 * mutable state.
 *
 * Usage Example:
 *   @code
 *   PremiumService service(std::make_unique<MemoryPremiumStore>(),
 *                          TableSource("premium_tables.xlsx", "matrix"));
 *   service.load_tables();
 *   Quote quote = service.calculate_premium({"1A", "100000", "1978-03-14"});
 *   std::cout << quote.premium_text() << std::endl;
 *   @endcode
 */
class PremiumService {
public:
    /**
     * @brief Source of "today" for age calculation
     */
    using DateProvider = std::function<CalendarDate()>;

    /**
     * @param store Rate store (owned)
     * @param source Premium matrix read by load_tables()
     * @param today Date provider, defaults to the local calendar date
     */
    PremiumService(std::unique_ptr<PremiumStore> store, TableSource source,
                   DateProvider today = &CalendarDate::today);

    /**
     * @brief Compute the premium for a request
     *
     * @throws PremiumError InvalidInput for malformed fields or a future
     *         date of birth, RiskCalculation when the applicant is under 18
     *         or no rate exists, InternalServer on store failure
     */
    Quote calculate_premium(const QuoteRequest& request);

    /**
     * @brief Read the premium matrix and replace the stored rates
     *
     * @throws PremiumError InternalServer if the file cannot be read, is
     *         invalid, or the store rejects the write
     */
    LoadSummary load_tables();

    /**
     * @brief Remove all stored rates
     *
     * @return Rate keys removed
     * @throws PremiumError InternalServer on store failure
     */
    size_t unload_tables();

    /**
     * @brief Whether any rate is stored
     *
     * @throws PremiumError InternalServer on store failure
     */
    bool tables_loaded();

    PremiumStore& store() { return *store_; }
    const TableSource& table_source() const { return source_; }

private:
    std::unique_ptr<PremiumStore> store_;
    TableSource source_;
    DateProvider today_;
};

} // namespace premium

#endif // PREMIUM_PREMIUM_SERVICE_HPP
