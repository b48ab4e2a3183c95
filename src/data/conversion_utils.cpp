// src/data/conversion_utils.cpp

#include "canslim_bt/data/conversion_utils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

namespace {

const char* kComponent = "DataConversionUtils";

int64_t seconds_from_timestamp(int64_t value, arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return value;
        case arrow::TimeUnit::MILLI:
            return value / 1000;
        case arrow::TimeUnit::MICRO:
            return value / 1000000;
        case arrow::TimeUnit::NANO:
            return value / 1000000000;
    }
    return value;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

const std::vector<std::string>& DataConversionUtils::price_columns() {
    static const std::vector<std::string> columns = {"date", "ticker", "open", "high",
                                                     "low",  "close",  "volume"};
    return columns;
}

const std::vector<std::string>& DataConversionUtils::financial_columns() {
    static const std::vector<std::string> columns = {
        "ticker", "timeframe", "fiscal_year", "fiscal_period", "end_date", "diluted_eps"};
    return columns;
}

const std::vector<std::string>& DataConversionUtils::universe_columns() {
    static const std::vector<std::string> columns = {"date", "tickers"};
    return columns;
}

Result<void> DataConversionUtils::require_columns(const std::shared_ptr<arrow::Table>& table,
                                                  const std::vector<std::string>& columns,
                                                  const std::string& table_name) {
    if (!table) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                table_name + " table pointer is null", kComponent);
    }
    for (const auto& column : columns) {
        if (table->GetColumnByName(column) == nullptr) {
            return make_error<void>(ErrorCode::MISSING_COLUMN,
                                    table_name + " table is missing required column: " + column,
                                    kComponent);
        }
    }
    return Result<void>();
}

Result<std::vector<double>> DataConversionUtils::read_doubles(
    const std::shared_ptr<arrow::Table>& table, const std::string& column,
    std::vector<bool>& valid) {
    auto chunked = table->GetColumnByName(column);
    std::vector<double> values;
    values.reserve(table->num_rows());
    valid.clear();
    valid.reserve(table->num_rows());

    for (int c = 0; c < chunked->num_chunks(); ++c) {
        const auto& array = chunked->chunk(c);
        for (int64_t i = 0; i < array->length(); ++i) {
            if (array->IsNull(i)) {
                values.push_back(kUndefined);
                valid.push_back(false);
                continue;
            }
            switch (array->type_id()) {
                case arrow::Type::DOUBLE:
                    values.push_back(std::static_pointer_cast<arrow::DoubleArray>(array)->Value(i));
                    break;
                case arrow::Type::FLOAT:
                    values.push_back(std::static_pointer_cast<arrow::FloatArray>(array)->Value(i));
                    break;
                case arrow::Type::INT64:
                    values.push_back(static_cast<double>(
                        std::static_pointer_cast<arrow::Int64Array>(array)->Value(i)));
                    break;
                case arrow::Type::INT32:
                    values.push_back(static_cast<double>(
                        std::static_pointer_cast<arrow::Int32Array>(array)->Value(i)));
                    break;
                default:
                    return make_error<std::vector<double>>(
                        ErrorCode::CONVERSION_ERROR,
                        "Column '" + column + "' has non-numeric type " +
                            array->type()->ToString(),
                        kComponent);
            }
            valid.push_back(true);
        }
    }
    return values;
}

Result<std::vector<std::string>> DataConversionUtils::read_strings(
    const std::shared_ptr<arrow::Table>& table, const std::string& column,
    std::vector<bool>& valid) {
    auto chunked = table->GetColumnByName(column);
    std::vector<std::string> values;
    values.reserve(table->num_rows());
    valid.clear();
    valid.reserve(table->num_rows());

    for (int c = 0; c < chunked->num_chunks(); ++c) {
        const auto& array = chunked->chunk(c);
        for (int64_t i = 0; i < array->length(); ++i) {
            if (array->IsNull(i)) {
                values.emplace_back();
                valid.push_back(false);
                continue;
            }
            switch (array->type_id()) {
                case arrow::Type::STRING:
                    values.push_back(
                        std::static_pointer_cast<arrow::StringArray>(array)->GetString(i));
                    break;
                case arrow::Type::LARGE_STRING:
                    values.push_back(
                        std::static_pointer_cast<arrow::LargeStringArray>(array)->GetString(i));
                    break;
                default:
                    return make_error<std::vector<std::string>>(
                        ErrorCode::CONVERSION_ERROR,
                        "Column '" + column + "' has non-string type " +
                            array->type()->ToString(),
                        kComponent);
            }
            valid.push_back(true);
        }
    }
    return values;
}

Result<std::vector<Timestamp>> DataConversionUtils::read_dates(
    const std::shared_ptr<arrow::Table>& table, const std::string& column,
    std::vector<bool>& valid) {
    auto chunked = table->GetColumnByName(column);
    std::vector<Timestamp> values;
    values.reserve(table->num_rows());
    valid.clear();
    valid.reserve(table->num_rows());

    for (int c = 0; c < chunked->num_chunks(); ++c) {
        const auto& array = chunked->chunk(c);
        for (int64_t i = 0; i < array->length(); ++i) {
            if (array->IsNull(i)) {
                values.emplace_back();
                valid.push_back(false);
                continue;
            }
            switch (array->type_id()) {
                case arrow::Type::DATE32: {
                    auto days = std::static_pointer_cast<arrow::Date32Array>(array)->Value(i);
                    values.push_back(core::from_day_number(days));
                    break;
                }
                case arrow::Type::DATE64: {
                    auto millis = std::static_pointer_cast<arrow::Date64Array>(array)->Value(i);
                    values.push_back(
                        core::floor_to_day(Timestamp(std::chrono::seconds(millis / 1000))));
                    break;
                }
                case arrow::Type::TIMESTAMP: {
                    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
                    auto unit =
                        std::static_pointer_cast<arrow::TimestampType>(array->type())->unit();
                    int64_t secs = seconds_from_timestamp(ts_array->Value(i), unit);
                    values.push_back(core::floor_to_day(Timestamp(std::chrono::seconds(secs))));
                    break;
                }
                case arrow::Type::STRING: {
                    auto text = std::static_pointer_cast<arrow::StringArray>(array)->GetString(i);
                    auto parsed = core::parse_date(text);
                    if (parsed.is_error()) {
                        return make_error<std::vector<Timestamp>>(
                            ErrorCode::CONVERSION_ERROR,
                            "Column '" + column + "': " + parsed.error()->what(), kComponent);
                    }
                    values.push_back(parsed.value());
                    break;
                }
                default:
                    return make_error<std::vector<Timestamp>>(
                        ErrorCode::CONVERSION_ERROR,
                        "Column '" + column + "' has non-date type " + array->type()->ToString(),
                        kComponent);
            }
            valid.push_back(true);
        }
    }
    return values;
}

Result<std::vector<PriceBar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    auto check = require_columns(table, price_columns(), "Price");
    if (check.is_error()) {
        return make_error<std::vector<PriceBar>>(check.error()->code(), check.error()->what(),
                                                 kComponent);
    }

    std::vector<bool> date_ok, ticker_ok, open_ok, high_ok, low_ok, close_ok, volume_ok;
    auto dates = read_dates(table, "date", date_ok);
    auto tickers = read_strings(table, "ticker", ticker_ok);
    auto opens = read_doubles(table, "open", open_ok);
    auto highs = read_doubles(table, "high", high_ok);
    auto lows = read_doubles(table, "low", low_ok);
    auto closes = read_doubles(table, "close", close_ok);
    auto volumes = read_doubles(table, "volume", volume_ok);

    for (const CanslimError* err : {dates.error(), tickers.error(), opens.error(), highs.error(),
                                    lows.error(), closes.error(), volumes.error()}) {
        if (err) {
            return make_error<std::vector<PriceBar>>(err->code(), err->what(), kComponent);
        }
    }

    const auto n = static_cast<size_t>(table->num_rows());
    std::vector<PriceBar> bars;
    bars.reserve(n);
    size_t skipped = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!date_ok[i] || !ticker_ok[i] || !open_ok[i] || !high_ok[i] || !low_ok[i] ||
            !close_ok[i] || !volume_ok[i]) {
            ++skipped;
            continue;
        }
        bars.emplace_back(dates.value()[i], opens.value()[i], highs.value()[i], lows.value()[i],
                          closes.value()[i], volumes.value()[i], tickers.value()[i]);
    }
    if (skipped > 0) {
        WARN("Skipped " << skipped << " price row(s) with null fields");
    }
    return bars;
}

Result<std::vector<FinancialRecord>> DataConversionUtils::arrow_table_to_financials(
    const std::shared_ptr<arrow::Table>& table) {
    auto check = require_columns(table, financial_columns(), "Financials");
    if (check.is_error()) {
        return make_error<std::vector<FinancialRecord>>(check.error()->code(),
                                                        check.error()->what(), kComponent);
    }

    std::vector<bool> ticker_ok, timeframe_ok, year_ok, period_ok, end_ok, eps_ok;
    auto tickers = read_strings(table, "ticker", ticker_ok);
    auto timeframes = read_strings(table, "timeframe", timeframe_ok);
    auto periods = read_strings(table, "fiscal_period", period_ok);
    auto end_dates = read_dates(table, "end_date", end_ok);
    auto eps = read_doubles(table, "diluted_eps", eps_ok);

    // fiscal_year arrives either as a number or as text such as "2023"
    std::vector<int> years;
    auto year_type = table->GetColumnByName("fiscal_year")->type()->id();
    if (year_type == arrow::Type::STRING || year_type == arrow::Type::LARGE_STRING) {
        auto year_text = read_strings(table, "fiscal_year", year_ok);
        if (year_text.is_error()) {
            return make_error<std::vector<FinancialRecord>>(
                year_text.error()->code(), year_text.error()->what(), kComponent);
        }
        for (size_t i = 0; i < year_text.value().size(); ++i) {
            const auto& text = year_text.value()[i];
            int year = 0;
            const char* end = text.data() + text.size();
            const auto parsed = std::from_chars(text.data(), end, year);
            if (!year_ok[i] || text.empty() || parsed.ec != std::errc() || parsed.ptr != end ||
                year <= 0) {
                year_ok[i] = false;
                years.push_back(0);
            } else {
                years.push_back(year);
            }
        }
    } else {
        auto year_values = read_doubles(table, "fiscal_year", year_ok);
        if (year_values.is_error()) {
            return make_error<std::vector<FinancialRecord>>(
                year_values.error()->code(), year_values.error()->what(), kComponent);
        }
        for (size_t i = 0; i < year_values.value().size(); ++i) {
            const double v = year_values.value()[i];
            if (is_undefined(v) || v <= 0.0 || v > 9999.0) {
                year_ok[i] = false;
                years.push_back(0);
            } else {
                years.push_back(static_cast<int>(v));
            }
        }
    }

    for (const CanslimError* err :
         {tickers.error(), timeframes.error(), periods.error(), end_dates.error(), eps.error()}) {
        if (err) {
            return make_error<std::vector<FinancialRecord>>(err->code(), err->what(),
                                                            kComponent);
        }
    }

    const auto n = static_cast<size_t>(table->num_rows());
    std::vector<FinancialRecord> records;
    records.reserve(n);
    size_t skipped = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!ticker_ok[i] || !timeframe_ok[i] || !year_ok[i] || !end_ok[i]) {
            ++skipped;
            continue;
        }
        std::string timeframe = to_lower(timeframes.value()[i]);
        FinancialRecord record;
        if (timeframe == "quarterly") {
            record.timeframe = Timeframe::QUARTERLY;
        } else if (timeframe == "annual") {
            record.timeframe = Timeframe::ANNUAL;
        } else {
            // trailing-twelve-month and other timeframes are not screened
            ++skipped;
            continue;
        }
        record.symbol = tickers.value()[i];
        record.fiscal_year = years[i];
        record.fiscal_period = period_ok[i] ? periods.value()[i] : std::string();
        record.end_date = end_dates.value()[i];
        // A null EPS is kept: it yields an undefined growth ratio, which fails the screen
        record.diluted_eps = eps_ok[i] ? eps.value()[i] : kUndefined;
        records.push_back(std::move(record));
    }
    if (skipped > 0) {
        WARN("Skipped " << skipped << " financial row(s) with null keys or unsupported timeframe");
    }
    return records;
}

Result<UniverseSnapshot> DataConversionUtils::arrow_table_to_universe(
    const std::shared_ptr<arrow::Table>& table, char delimiter) {
    auto check = require_columns(table, universe_columns(), "Universe");
    if (check.is_error()) {
        return make_error<UniverseSnapshot>(check.error()->code(), check.error()->what(),
                                            kComponent);
    }

    std::vector<bool> date_ok, tickers_ok;
    auto dates = read_dates(table, "date", date_ok);
    if (dates.is_error()) {
        return make_error<UniverseSnapshot>(dates.error()->code(), dates.error()->what(),
                                            kComponent);
    }
    auto lists = read_strings(table, "tickers", tickers_ok);
    if (lists.is_error()) {
        return make_error<UniverseSnapshot>(lists.error()->code(), lists.error()->what(),
                                            kComponent);
    }

    UniverseSnapshot snapshot;
    for (size_t i = 0; i < dates.value().size(); ++i) {
        if (!date_ok[i]) {
            WARN("Skipping universe row " << i << " with a null date");
            continue;
        }
        std::vector<std::string> members;
        if (tickers_ok[i]) {
            members = UniverseSnapshot::parse_members(lists.value()[i], delimiter);
        }
        snapshot.set_members(dates.value()[i], std::move(members));
    }
    return snapshot;
}

}  // namespace canslim_bt
