/**
 * @file audit_logger.cpp
 * @brief Implementation of the structured audit logger
 */

#include "audit_logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ledgercalc {
namespace io {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void add_installment_fields(std::map<std::string, std::string>& fields,
                            const std::string& prefix,
                            const Installment& installment) {
    fields[prefix + ".id"] = installment.id.to_string();
    fields[prefix + ".amount"] = installment.amount.to_string();
    fields[prefix + ".due_date"] = format_date(installment.due_date);
    fields[prefix + ".paid_amount"] = installment.paid_amount.to_string();
    fields[prefix + ".status"] = installment_status_to_string(installment.status);
    if (installment.paid_date) {
        fields[prefix + ".paid_date"] = format_date(*installment.paid_date);
    }
    if (installment.parent) {
        fields[prefix + ".parent"] = installment.parent->to_string();
    }
    if (installment.accrued_through) {
        fields[prefix + ".accrued_through"] = format_date(*installment.accrued_through);
    }
    if (!installment.cancel_reason.empty()) {
        fields[prefix + ".cancel_reason"] = installment.cancel_reason;
    }
}

// ============================================================================
// AuditLogger Implementation
// ============================================================================

AuditLogger::AuditLogger(const LoggerConfig& config) {
    configure(config);
}

AuditLogger::~AuditLogger() {
    flush();
}

void AuditLogger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            throw std::runtime_error("Failed to open audit log file: " + config_.log_file_path);
        }
    }
}

void AuditLogger::log_plan_created(const AuditContext& ctx, const AmortizationPlan& plan) {
    Fields fields = context_fields(ctx, "plan_created");
    fields["total_amount"] = plan.total_amount().to_string();
    fields["installment_count"] = std::to_string(plan.installment_count());
    fields["first_due_date"] = format_date(plan.first_due_date());
    fields["periodicity"] = plan.periodicity().to_string();
    if (!plan.installments().empty()) {
        fields["first_amount"] = plan.installments().front().amount.to_string();
        fields["last_amount"] = plan.installments().back().amount.to_string();
        fields["last_due_date"] = format_date(plan.installments().back().due_date);
    }

    log(LogLevel::INFO, "Amortization plan created", fields);
}

void AuditLogger::log_payment_applied(
    const AuditContext& ctx,
    const Installment& before,
    const PaymentEvent& event,
    const PaymentOutcome& outcome
) {
    Fields fields = context_fields(ctx, "payment_applied");
    fields["payment.installment_ref"] = event.installment_ref.to_string();
    fields["payment.amount_paid"] = event.amount_paid.to_string();
    fields["payment.date"] = format_date(event.payment_date);

    add_installment_fields(fields, "before", before);
    add_installment_fields(fields, "after", outcome.updated);
    if (outcome.residual) {
        add_installment_fields(fields, "residual", *outcome.residual);
    }

    fields["accrual.penalty"] = outcome.accrual.penalty.to_string();
    fields["accrual.interest"] = outcome.accrual.interest.to_string();
    fields["accrual.discount"] = outcome.accrual.discount.to_string();
    fields["accrual.days_late"] = std::to_string(outcome.accrual.days_late);
    fields["accrual.billable_days"] = std::to_string(outcome.accrual.billable_days);
    fields["amount_due"] = outcome.amount_due.to_string();
    if (!outcome.change.is_zero()) {
        fields["change"] = outcome.change.to_string();
    }

    log(LogLevel::INFO, "Payment applied", fields);
}

void AuditLogger::log_installment_cancelled(
    const AuditContext& ctx,
    const Installment& before,
    const Installment& after
) {
    Fields fields = context_fields(ctx, "installment_cancelled");
    add_installment_fields(fields, "before", before);
    add_installment_fields(fields, "after", after);
    fields["reason"] = after.cancel_reason;

    log(LogLevel::INFO, "Installment cancelled", fields);
}

void AuditLogger::log_balance_reconciled(
    const AuditContext& ctx,
    Money computed_balance,
    Money statement_balance,
    const std::optional<AdjustmentEntry>& adjustment
) {
    Fields fields = context_fields(ctx, "balance_reconciled");
    fields["computed_balance"] = computed_balance.to_string();
    fields["statement_balance"] = statement_balance.to_string();
    if (adjustment) {
        fields["adjustment.type"] = entry_type_to_string(adjustment->type);
        fields["adjustment.amount"] = adjustment->amount.to_string();
        fields["adjustment.date"] = format_date(adjustment->date);
        fields["adjustment.reason"] = adjustment->reason;
    } else {
        fields["adjustment"] = "none";
    }

    log(adjustment ? LogLevel::WARN : LogLevel::INFO, "Balance reconciled", fields);
}

void AuditLogger::log_error(const AuditContext& ctx, const std::string& operation,
                            const LedgerCalcError& error) {
    Fields fields = context_fields(ctx, "error");
    fields["operation"] = operation;
    fields["error_kind"] = error_kind_to_string(error.kind());
    fields["error_message"] = error.what();

    log(LogLevel::ERROR, "Operation failed", fields);
}

void AuditLogger::log_error(const AuditContext& ctx, const std::string& operation,
                            const std::string& message) {
    Fields fields = context_fields(ctx, "error");
    fields["operation"] = operation;
    fields["error_message"] = message;

    log(LogLevel::ERROR, "Operation failed", fields);
}

void AuditLogger::log_warning(const AuditContext& ctx, const std::string& warning_message) {
    Fields fields = context_fields(ctx, "warning");
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void AuditLogger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (config_.stream) {
        config_.stream->flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

AuditLogger::Fields AuditLogger::context_fields(const AuditContext& ctx, const std::string& event) const {
    Fields fields;
    fields["event"] = event;
    if (!ctx.plan_id.empty()) {
        fields["plan_id"] = ctx.plan_id;
    }
    if (!ctx.actor.empty()) {
        fields["actor"] = ctx.actor;
    }
    if (!ctx.correlation_id.empty()) {
        fields["correlation_id"] = ctx.correlation_id;
    }
    return fields;
}

void AuditLogger::log(LogLevel level, const std::string& message, const Fields& fields) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;
    if (config_.enable_json) {
        nlohmann::json line(fields);
        line["timestamp"] = get_timestamp();
        line["level"] = level_to_string(level);
        line["message"] = message;
        output = line.dump();
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;
        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }
        output = oss.str();
    }

    write_output(output);
}

std::string AuditLogger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

void AuditLogger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }
    if (config_.stream) {
        *config_.stream << output << "\n";
    }
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace io
} // namespace ledgercalc
