#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#endif

namespace powerfin {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

// Builds one float64 column; nullopt and non-finite values become null
template <typename Row>
std::shared_ptr<arrow::Array> double_column(const std::vector<Row>& rows,
                                            const std::string& name,
                                            const std::function<std::optional<double>(const Row&)>& get) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(rows.size())), "reserve memory for " + name + " column");
    for (const auto& row : rows) {
        std::optional<double> value = get(row);
        if (value && std::isfinite(*value)) {
            check(builder.Append(*value), "append " + name);
        } else {
            check(builder.AppendNull(), "append " + name);
        }
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& filepath) {
    auto outfile = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile.status().ToString());
    }
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *outfile, 1024 * 1024),
          "write Parquet table");
    check((*outfile)->Close(), "close Parquet file");
}

} // anonymous namespace

void ParquetWriter::write_monte_carlo(const MonteCarloResult& result, const std::string& filepath) {
    if (result.rows.empty()) {
        throw std::runtime_error("MonteCarloResult has no trials to write");
    }
    const auto& rows = result.rows;
    using Getter = std::function<std::optional<double>(const MonteCarloRow&)>;

    arrow::UInt32Builder iteration_builder;
    check(iteration_builder.Reserve(static_cast<int64_t>(rows.size())), "reserve memory for iteration column");
    for (const auto& row : rows) {
        check(iteration_builder.Append(static_cast<uint32_t>(row.iteration)), "append iteration");
    }
    std::shared_ptr<arrow::Array> iteration_array;
    check(iteration_builder.Finish(&iteration_array), "finish iteration array");

    std::vector<std::pair<std::string, Getter>> columns = {
        {"capacity_factor", [](const MonteCarloRow& r) { return std::optional<double>(r.capacity_factor); }},
        {"opex_usd_per_mwh", [](const MonteCarloRow& r) { return std::optional<double>(r.opex_usd_per_mwh); }},
        {"fx_depreciation", [](const MonteCarloRow& r) { return std::optional<double>(r.fx_depreciation); }},
        {"hard_currency_rate", [](const MonteCarloRow& r) { return std::optional<double>(r.hard_currency_rate); }},
        {"local_currency_rate", [](const MonteCarloRow& r) { return std::optional<double>(r.local_currency_rate); }},
        {"debt_ratio", [](const MonteCarloRow& r) { return std::optional<double>(r.debt_ratio); }},
        {"equity_irr", [](const MonteCarloRow& r) { return std::optional<double>(r.equity_irr); }},
        {"project_irr", [](const MonteCarloRow& r) { return std::optional<double>(r.project_irr); }},
        {"npv", [](const MonteCarloRow& r) { return std::optional<double>(r.npv); }},
        {"min_dscr", [](const MonteCarloRow& r) { return r.min_dscr; }}
    };

    arrow::FieldVector fields = {arrow::field("iteration", arrow::uint32())};
    std::vector<std::shared_ptr<arrow::Array>> arrays = {iteration_array};
    for (const auto& column : columns) {
        fields.push_back(arrow::field(column.first, arrow::float64()));
        arrays.push_back(double_column<MonteCarloRow>(rows, column.first, column.second));
    }

    write_table(arrow::Table::Make(arrow::schema(fields), arrays), filepath);
}

void ParquetWriter::write_schedule(const FinancialResults& results, const std::string& filepath) {
    if (results.rows.empty()) {
        throw std::runtime_error("FinancialResults has no schedule rows to write");
    }
    const auto& rows = results.rows;
    using Getter = std::function<std::optional<double>(const YearRow&)>;

    arrow::Int32Builder year_builder;
    check(year_builder.Reserve(static_cast<int64_t>(rows.size())), "reserve memory for year column");
    for (const auto& row : rows) {
        check(year_builder.Append(row.year), "append year");
    }
    std::shared_ptr<arrow::Array> year_array;
    check(year_builder.Finish(&year_array), "finish year array");

    std::vector<std::pair<std::string, Getter>> columns = {
        {"generation_mwh", [](const YearRow& r) { return std::optional<double>(r.generation_mwh); }},
        {"fx_rate", [](const YearRow& r) { return std::optional<double>(r.fx_rate); }},
        {"revenue", [](const YearRow& r) { return std::optional<double>(r.revenue); }},
        {"levy", [](const YearRow& r) { return std::optional<double>(r.levy); }},
        {"opex", [](const YearRow& r) { return std::optional<double>(r.opex); }},
        {"ebitda", [](const YearRow& r) { return std::optional<double>(r.ebitda); }},
        {"depreciation", [](const YearRow& r) { return std::optional<double>(r.depreciation); }},
        {"interest", [](const YearRow& r) { return std::optional<double>(r.interest); }},
        {"principal", [](const YearRow& r) { return std::optional<double>(r.principal); }},
        {"tax", [](const YearRow& r) { return std::optional<double>(r.tax); }},
        {"cfads", [](const YearRow& r) { return std::optional<double>(r.cfads); }},
        {"debt_service", [](const YearRow& r) { return std::optional<double>(r.debt_service); }},
        {"equity_cashflow", [](const YearRow& r) { return std::optional<double>(r.equity_cashflow); }},
        {"project_cashflow", [](const YearRow& r) { return std::optional<double>(r.project_cashflow); }},
        {"dscr", [](const YearRow& r) { return r.dscr; }}
    };

    arrow::FieldVector fields = {arrow::field("year", arrow::int32())};
    std::vector<std::shared_ptr<arrow::Array>> arrays = {year_array};
    for (const auto& column : columns) {
        fields.push_back(arrow::field(column.first, arrow::float64()));
        arrays.push_back(double_column<YearRow>(rows, column.first, column.second));
    }

    write_table(arrow::Table::Make(arrow::schema(fields), arrays), filepath);
}

#else // !HAVE_ARROW

void ParquetWriter::write_monte_carlo(const MonteCarloResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

void ParquetWriter::write_schedule(const FinancialResults& /* results */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace powerfin
