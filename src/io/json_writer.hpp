#ifndef LEDGERCALC_IO_JSON_WRITER_HPP
#define LEDGERCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../accrual.hpp"
#include "../amortization.hpp"
#include "../cashflow.hpp"
#include "../installment.hpp"
#include "../portfolio.hpp"

namespace ledgercalc {
namespace io {

// Snapshots for the caller's audit and reporting layers. Money is written as
// a decimal string ("1000.00") and dates as "YYYY-MM-DD" so no value passes
// through a binary float.
nlohmann::json to_json(const Installment& installment);
nlohmann::json to_json(const AccrualResult& accrual);
nlohmann::json to_json(const AdjustmentEntry& adjustment);
nlohmann::json to_json(const CashflowBucket& bucket);
nlohmann::json to_json(const AmortizationPlan& plan);
nlohmann::json to_json(const AgingReport& report);

// {"bucket_count": N, "closing_balance": "...", "buckets": [...]}
void write_projection_json(std::ostream& os, const std::vector<CashflowBucket>& buckets,
                           bool pretty_print = true);

void write_projection_json(const std::string& filepath, const std::vector<CashflowBucket>& buckets,
                           bool pretty_print = true);

} // namespace io
} // namespace ledgercalc

#endif // LEDGERCALC_IO_JSON_WRITER_HPP
