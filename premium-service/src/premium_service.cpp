/**
 * @file premium_service.cpp
 * @brief Implementation of PremiumService
 */

#include "premium_service.hpp"
#include "logger.hpp"
#include "../../premium-engine/src/age_band.hpp"
#include "../../premium-engine/src/io/table_loader.hpp"
#include <chrono>
#include <stdexcept>

namespace premium {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

PremiumError store_failure(const std::string& operation, const StoreError& e) {
    Logger::get_instance().log_error("store", operation + " failed", e.what());
    return PremiumError(ErrorKind::InternalServer);
}

} // anonymous namespace

std::string Quote::premium_text() const {
    return format_premium(premium);
}

PremiumService::PremiumService(std::unique_ptr<PremiumStore> store, TableSource source,
                               DateProvider today)
    : store_(std::move(store)), source_(std::move(source)), today_(std::move(today)) {
    if (!store_) {
        throw std::invalid_argument("PremiumService requires a store");
    }
}

Quote PremiumService::calculate_premium(const QuoteRequest& request) {
    Logger& logger = Logger::get_instance();

    std::string code = trim(request.code);
    if (!is_valid_product_code(code)) {
        throw PremiumError(ErrorKind::InvalidInput, "Invalid code");
    }

    std::string sum_insured;
    try {
        sum_insured = normalize_sum_insured(trim(request.sum_insured));
    } catch (const std::invalid_argument&) {
        throw PremiumError(ErrorKind::InvalidInput, "Invalid sumInsured");
    }

    CalendarDate date_of_birth;
    try {
        date_of_birth = CalendarDate::parse(trim(request.date_of_birth));
    } catch (const std::invalid_argument&) {
        throw PremiumError(ErrorKind::InvalidInput, "Invalid dateOfBirth");
    }

    CalendarDate today = today_();
    if (today < date_of_birth) {
        throw PremiumError(ErrorKind::InvalidInput, "dateOfBirth is in the future");
    }

    Quote quote;
    quote.rate_key = make_rate_key(code, sum_insured);
    quote.age = age_on(date_of_birth, today);
    quote.score = age_band_score(quote.age);

    if (!is_rateable(quote.score)) {
        logger.log_warning("service", "Age " + std::to_string(quote.age) + " is below the rated bands");
        throw PremiumError(ErrorKind::RiskCalculation);
    }

    std::optional<double> premium;
    try {
        premium = store_->find_premium(quote.rate_key, quote.score);
    } catch (const StoreError& e) {
        throw store_failure("Premium lookup", e);
    }

    if (!premium) {
        logger.log_warning("service", "No rate for " + quote.rate_key +
                                      " band " + std::to_string(quote.score) + " (ages " +
                                      age_band_for_score(quote.score).label() + ")");
        throw PremiumError(ErrorKind::RiskCalculation);
    }

    quote.premium = *premium;
    logger.log_premium_quoted(quote.rate_key, quote.age, quote.score, quote.premium_text());
    return quote;
}

LoadSummary PremiumService::load_tables() {
    Logger& logger = Logger::get_instance();
    auto start = std::chrono::steady_clock::now();

    PremiumTable table;
    try {
        table = io::load_premium_table(source_.path, source_.sheet);
    } catch (const TableLoadError& e) {
        logger.log_error("service", "Cannot load premium tables", e.what());
        throw PremiumError(ErrorKind::InternalServer);
    }

    try {
        store_->replace_rates(table);
    } catch (const StoreError& e) {
        throw store_failure("Storing premium tables", e);
    }

    auto end = std::chrono::steady_clock::now();

    LoadSummary summary;
    summary.rows = table.size();
    summary.keys = table.key_count();
    summary.path = source_.path;
    summary.sheet = source_.sheet;
    summary.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

    logger.log_tables_loaded(summary.path, summary.sheet, summary.rows, summary.keys,
                             summary.duration_ms);
    return summary;
}

size_t PremiumService::unload_tables() {
    size_t removed = 0;
    try {
        removed = store_->clear();
    } catch (const StoreError& e) {
        throw store_failure("Unloading premium tables", e);
    }

    Logger::get_instance().log_tables_unloaded(removed);
    return removed;
}

bool PremiumService::tables_loaded() {
    try {
        return store_->has_rates();
    } catch (const StoreError& e) {
        throw store_failure("Checking premium tables", e);
    }
}

} // namespace premium
