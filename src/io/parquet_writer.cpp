#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace loancalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> build_double_column(const std::vector<double>& values,
                                                  const std::string& name) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(values.size())), "reserve memory for " + name + " column");
    check(builder.AppendValues(values), "append " + name + " values");

    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_history(const ChartSeries& series, const std::string& filepath) {
    if (!series.has_data()) {
        throw std::runtime_error("No simulation history to write. Run the simulation first.");
    }

    auto schema = arrow::schema({
        arrow::field("date", arrow::utf8()),
        arrow::field("salary", arrow::float64()),
        arrow::field("balance", arrow::float64()),
        arrow::field("total_repaid", arrow::float64()),
        arrow::field("net_salary_lost", arrow::float64()),
        arrow::field("salary_after_tax", arrow::float64())
    });

    arrow::StringBuilder date_builder;
    check(date_builder.Reserve(static_cast<int64_t>(series.size())), "reserve memory for date column");
    for (const Date& date : series.dates) {
        check(date_builder.Append(date.to_string()), "append date");
    }
    std::shared_ptr<arrow::Array> date_array;
    check(date_builder.Finish(&date_array), "finish date array");

    auto table = arrow::Table::Make(schema, {
        date_array,
        build_double_column(series.salary, "salary"),
        build_double_column(series.balance, "balance"),
        build_double_column(series.total_repaid, "total_repaid"),
        build_double_column(series.net_salary_lost, "net_salary_lost"),
        build_double_column(series.salary_after_tax, "salary_after_tax")
    });

    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    auto open_result = arrow::io::FileOutputStream::Open(filepath);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 open_result.status().ToString());
    }
    outfile = *open_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_history(const ChartSeries& /* series */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace loancalc
