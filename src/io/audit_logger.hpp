/**
 * @file audit_logger.hpp
 * @brief Structured audit logging for ledger operations
 *
 * The AuditLogger records what callers did with the engine:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON lines or plain-text output
 * - Before/after installment snapshots flattened into "before.*" / "after.*" fields
 * - Console (stderr) and append-to-file sinks
 *
 * The engine core never logs. Callers own an AuditLogger instance and hand it
 * the inputs and outputs of pay/cancel/reconcile.
 */

#ifndef LEDGERCALC_IO_AUDIT_LOGGER_HPP
#define LEDGERCALC_IO_AUDIT_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include "../amortization.hpp"
#include "../cashflow.hpp"
#include "../errors.hpp"
#include "../payment.hpp"

namespace ledgercalc {
namespace io {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Accrual breakdowns and intermediate values
    INFO,    ///< Plans, payments, cancellations, reconciliations
    WARN,    ///< Non-fatal issues
    ERROR    ///< Failed operations
};

std::string level_to_string(LogLevel level);

/**
 * @brief Parse log level from string; unknown names map to INFO
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Who did what, attached to every event
 */
struct AuditContext {
    std::string plan_id;             ///< Caller's identifier for the plan / ledger
    std::string actor;               ///< User or service performing the operation
    std::string correlation_id;      ///< Request identifier for cross-system tracing

    AuditContext() = default;
    AuditContext(const std::string& plan, const std::string& who)
        : plan_id(plan), actor(who) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Append to log_file_path
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< JSON lines (vs. plain text)
    std::ostream* stream;            ///< Optional extra sink, not owned

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("ledgercalc-audit.log"),
          enable_json(true),
          stream(nullptr) {}
};

/**
 * @brief Structured audit logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.enable_file = true;
 *   config.log_file_path = "audit.log";
 *   AuditLogger logger(config);
 *
 *   AuditContext ctx("plan-42", "billing-service");
 *   PaymentOutcome outcome = pay(installment, event, policy, engine_config);
 *   logger.log_payment_applied(ctx, installment, event, outcome);
 *   @endcode
 */
class AuditLogger {
public:
    explicit AuditLogger(const LoggerConfig& config = LoggerConfig());
    ~AuditLogger();

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    /**
     * @brief Replace the configuration, reopening the log file if enabled
     *
     * @throws std::runtime_error if the log file cannot be opened
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a newly materialized plan
     */
    void log_plan_created(const AuditContext& ctx, const AmortizationPlan& plan);

    /**
     * @brief Log a payment with before/after snapshots
     *
     * Emits the residual (if any) and the accrual breakdown alongside.
     */
    void log_payment_applied(
        const AuditContext& ctx,
        const Installment& before,
        const PaymentEvent& event,
        const PaymentOutcome& outcome
    );

    /**
     * @brief Log a cancellation with before/after snapshots
     */
    void log_installment_cancelled(
        const AuditContext& ctx,
        const Installment& before,
        const Installment& after
    );

    /**
     * @brief Log a bank reconciliation and the adjustment it produced
     */
    void log_balance_reconciled(
        const AuditContext& ctx,
        Money computed_balance,
        Money statement_balance,
        const std::optional<AdjustmentEntry>& adjustment
    );

    /**
     * @brief Log a failed engine operation
     *
     * @param operation Name of the failed call (e.g. "pay")
     */
    void log_error(const AuditContext& ctx, const std::string& operation, const LedgerCalcError& error);
    void log_error(const AuditContext& ctx, const std::string& operation, const std::string& message);

    void log_warning(const AuditContext& ctx, const std::string& warning_message);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    using Fields = std::map<std::string, std::string>;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const Fields& fields);
    std::string get_timestamp() const;
    Fields context_fields(const AuditContext& ctx, const std::string& event) const;
    void write_output(const std::string& output);
};

/**
 * @brief Flatten an installment snapshot into prefix.field entries
 */
void add_installment_fields(std::map<std::string, std::string>& fields,
                            const std::string& prefix,
                            const Installment& installment);

} // namespace io
} // namespace ledgercalc

#endif // LEDGERCALC_IO_AUDIT_LOGGER_HPP
