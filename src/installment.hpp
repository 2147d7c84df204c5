#ifndef LEDGERCALC_INSTALLMENT_HPP
#define LEDGERCALC_INSTALLMENT_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "date_utils.hpp"
#include "money.hpp"

namespace ledgercalc {

// Installment identifier: sequence number within the plan plus a split
// counter for residuals. {3, 0} renders "3", its residuals "3.1", "3.2", ...
// Ordering is (sequence, split) so residuals sort right after their parent.
struct InstallmentId {
    uint32_t sequence = 0;
    uint32_t split = 0;

    InstallmentId() = default;
    InstallmentId(uint32_t seq, uint32_t split_index = 0) : sequence(seq), split(split_index) {}

    bool is_residual() const { return split != 0; }
    InstallmentId next_split() const { return InstallmentId(sequence, split + 1); }

    std::string to_string() const;
    static InstallmentId parse(const std::string& text);

    bool operator==(const InstallmentId& other) const {
        return sequence == other.sequence && split == other.split;
    }
    bool operator!=(const InstallmentId& other) const { return !(*this == other); }
    bool operator<(const InstallmentId& other) const {
        return sequence != other.sequence ? sequence < other.sequence : split < other.split;
    }
};

std::ostream& operator<<(std::ostream& os, const InstallmentId& id);

// OVERDUE is never stored by the engine; it is derived on read
// (see effective_status in payment.hpp).
enum class InstallmentStatus : uint8_t {
    Pending = 0,
    PartiallyPaid = 1,
    Paid = 2,
    Overdue = 3,
    Cancelled = 4
};

std::string installment_status_to_string(InstallmentStatus status);
InstallmentStatus installment_status_from_string(const std::string& name);

struct Installment {
    InstallmentId id;
    Money amount;
    Date due_date;
    Money paid_amount;
    std::optional<Date> paid_date;
    InstallmentStatus status = InstallmentStatus::Pending;

    // Residual linkage
    std::optional<InstallmentId> parent;        // installment this residual was split from
    std::optional<Date> accrued_through;        // charges up to this date are folded into amount
    bool penalty_charged = false;               // one-time penalty already collected
    std::string cancel_reason;

    Installment() : due_date(boost::gregorian::not_a_date_time) {}
    Installment(InstallmentId installment_id, Money installment_amount, Date due);

    // PAID and CANCELLED accept no further events
    bool is_terminal() const;

    // Still owes its full amount (PENDING or a stored OVERDUE)
    bool is_open() const;

    bool operator==(const Installment& other) const;
};

} // namespace ledgercalc

#endif // LEDGERCALC_INSTALLMENT_HPP
