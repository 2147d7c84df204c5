#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace ledgercalc {
namespace io {

namespace {

json optional_date(const std::optional<Date>& date) {
    return date ? json(format_date(*date)) : json(nullptr);
}

} // namespace

json to_json(const Installment& installment) {
    json j;
    j["id"] = installment.id.to_string();
    j["amount"] = installment.amount.to_string();
    j["due_date"] = format_date(installment.due_date);
    j["paid_amount"] = installment.paid_amount.to_string();
    j["paid_date"] = optional_date(installment.paid_date);
    j["status"] = installment_status_to_string(installment.status);
    j["parent"] = installment.parent ? json(installment.parent->to_string()) : json(nullptr);
    j["accrued_through"] = optional_date(installment.accrued_through);
    j["penalty_charged"] = installment.penalty_charged;
    if (!installment.cancel_reason.empty()) {
        j["cancel_reason"] = installment.cancel_reason;
    }
    return j;
}

json to_json(const AccrualResult& accrual) {
    return json{
        {"penalty", accrual.penalty.to_string()},
        {"interest", accrual.interest.to_string()},
        {"discount", accrual.discount.to_string()},
        {"days_late", accrual.days_late},
        {"days_early", accrual.days_early},
        {"billable_days", accrual.billable_days}
    };
}

json to_json(const AdjustmentEntry& adjustment) {
    return json{
        {"type", entry_type_to_string(adjustment.type)},
        {"amount", adjustment.amount.to_string()},
        {"date", format_date(adjustment.date)},
        {"reason", adjustment.reason}
    };
}

json to_json(const CashflowBucket& bucket) {
    return json{
        {"date", format_date(bucket.date)},
        {"inflow", bucket.inflow.to_string()},
        {"outflow", bucket.outflow.to_string()},
        {"daily_balance", bucket.daily_balance.to_string()},
        {"running_balance", bucket.running_balance.to_string()}
    };
}

json to_json(const AmortizationPlan& plan) {
    json installments = json::array();
    for (const auto& installment : plan.installments()) {
        installments.push_back(to_json(installment));
    }

    json j;
    j["total_amount"] = plan.total_amount().to_string();
    j["installment_count"] = plan.installment_count();
    j["first_due_date"] = format_date(plan.first_due_date());
    j["periodicity"] = plan.periodicity().to_string();
    j["installments"] = installments;
    return j;
}

json to_json(const AgingReport& report) {
    json buckets = json::array();
    for (const auto& bucket : report.buckets) {
        buckets.push_back(json{
            {"range", bucket.label()},
            {"amount", bucket.amount.to_string()},
            {"count", bucket.count}
        });
    }

    json j;
    j["total_tracked"] = report.total_tracked.to_string();
    j["total_open"] = report.total_open.to_string();
    j["total_overdue"] = report.total_overdue.to_string();
    j["delinquency_rate"] = round_decimal(report.delinquency_rate, 4, RoundingMode::HalfEven)
                                .str(4, std::ios_base::fixed);
    j["buckets"] = buckets;
    return j;
}

void write_projection_json(std::ostream& os, const std::vector<CashflowBucket>& buckets,
                           bool pretty_print) {
    json rows = json::array();
    for (const auto& bucket : buckets) {
        rows.push_back(to_json(bucket));
    }

    json document;
    document["bucket_count"] = buckets.size();
    document["closing_balance"] = buckets.empty()
        ? json(nullptr)
        : json(buckets.back().running_balance.to_string());
    document["buckets"] = rows;

    os << document.dump(pretty_print ? 2 : -1) << "\n";
}

void write_projection_json(const std::string& filepath, const std::vector<CashflowBucket>& buckets,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_projection_json(file, buckets, pretty_print);
}

} // namespace io
} // namespace ledgercalc
