// include/canslim_bt/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "canslim_bt/core/error.hpp"
#include "canslim_bt/core/types.hpp"
#include "canslim_bt/data/universe_snapshot.hpp"

namespace canslim_bt {

/**
 * @brief Conversion of Arrow tables handed over by the storage layer
 *
 * Accepted column encodings:
 * - dates: date32, date64, timestamp (any unit) or "YYYY-MM-DD" strings
 * - numbers: double, float, int32, int64
 * - text: utf8 or large_utf8
 * A required column that is absent is reported as ErrorCode::MISSING_COLUMN.
 */
class DataConversionUtils {
public:
    /**
     * @brief Convert a price table (date, ticker, open, high, low, close, volume)
     * Rows with a null in any required field are skipped with a warning.
     */
    static Result<std::vector<PriceBar>> arrow_table_to_bars(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert a filings table
     * (ticker, timeframe, fiscal_year, fiscal_period, end_date, diluted_eps)
     * Rows whose timeframe is neither "quarterly" nor "annual" are skipped.
     */
    static Result<std::vector<FinancialRecord>> arrow_table_to_financials(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert a membership table (date, tickers) with delimited ticker lists
     */
    static Result<UniverseSnapshot> arrow_table_to_universe(
        const std::shared_ptr<arrow::Table>& table, char delimiter = ',');

    static const std::vector<std::string>& price_columns();
    static const std::vector<std::string>& financial_columns();
    static const std::vector<std::string>& universe_columns();

private:
    static Result<void> require_columns(const std::shared_ptr<arrow::Table>& table,
                                        const std::vector<std::string>& columns,
                                        const std::string& table_name);

    /**
     * @brief Column values flattened across chunks; valid[i] is false for nulls
     */
    static Result<std::vector<double>> read_doubles(const std::shared_ptr<arrow::Table>& table,
                                                    const std::string& column,
                                                    std::vector<bool>& valid);

    static Result<std::vector<std::string>> read_strings(
        const std::shared_ptr<arrow::Table>& table, const std::string& column,
        std::vector<bool>& valid);

    static Result<std::vector<Timestamp>> read_dates(const std::shared_ptr<arrow::Table>& table,
                                                     const std::string& column,
                                                     std::vector<bool>& valid);
};

}  // namespace canslim_bt
