#include "installment.hpp"
#include <limits>
#include <stdexcept>

namespace ledgercalc {

namespace {

uint32_t parse_component(const std::string& text, const std::string& whole) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Malformed installment id: '" + whole + "'");
    }
    const unsigned long long value = std::stoull(text);
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Installment id component out of range: '" + whole + "'");
    }
    return static_cast<uint32_t>(value);
}

} // namespace

std::string InstallmentId::to_string() const {
    std::string result = std::to_string(sequence);
    if (split != 0) {
        result += "." + std::to_string(split);
    }
    return result;
}

InstallmentId InstallmentId::parse(const std::string& text) {
    const size_t dot = text.find('.');
    if (dot == std::string::npos) {
        return InstallmentId(parse_component(text, text));
    }
    return InstallmentId(parse_component(text.substr(0, dot), text),
                         parse_component(text.substr(dot + 1), text));
}

std::ostream& operator<<(std::ostream& os, const InstallmentId& id) {
    return os << id.to_string();
}

std::string installment_status_to_string(InstallmentStatus status) {
    switch (status) {
        case InstallmentStatus::Pending: return "PENDING";
        case InstallmentStatus::PartiallyPaid: return "PARTIALLY_PAID";
        case InstallmentStatus::Paid: return "PAID";
        case InstallmentStatus::Overdue: return "OVERDUE";
        case InstallmentStatus::Cancelled: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

InstallmentStatus installment_status_from_string(const std::string& name) {
    if (name == "PENDING") return InstallmentStatus::Pending;
    if (name == "PARTIALLY_PAID") return InstallmentStatus::PartiallyPaid;
    if (name == "PAID") return InstallmentStatus::Paid;
    if (name == "OVERDUE") return InstallmentStatus::Overdue;
    if (name == "CANCELLED") return InstallmentStatus::Cancelled;
    throw std::invalid_argument("Unknown installment status: " + name);
}

// ============================================================================
// Installment Implementation
// ============================================================================

Installment::Installment(InstallmentId installment_id, Money installment_amount, Date due)
    : id(installment_id),
      amount(installment_amount),
      due_date(due) {}

bool Installment::is_terminal() const {
    return status == InstallmentStatus::Paid || status == InstallmentStatus::Cancelled;
}

bool Installment::is_open() const {
    return status == InstallmentStatus::Pending || status == InstallmentStatus::Overdue;
}

bool Installment::operator==(const Installment& other) const {
    return id == other.id &&
           amount == other.amount &&
           due_date == other.due_date &&
           paid_amount == other.paid_amount &&
           paid_date == other.paid_date &&
           status == other.status &&
           parent == other.parent &&
           accrued_through == other.accrued_through &&
           penalty_charged == other.penalty_charged &&
           cancel_reason == other.cancel_reason;
}

} // namespace ledgercalc
