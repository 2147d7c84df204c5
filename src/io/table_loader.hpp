#ifndef LEDGERCALC_IO_TABLE_LOADER_HPP
#define LEDGERCALC_IO_TABLE_LOADER_HPP

#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "../date_utils.hpp"
#include "../interest_policy.hpp"

namespace ledgercalc {
namespace io {

class TableLoadError : public std::runtime_error {
public:
    explicit TableLoadError(const std::string& message)
        : std::runtime_error(message) {}
};

// One-off holidays from CSV with header "date,name":
//   2024-11-20,Consciencia Negra
// Throws TableLoadError on unreadable files, bad dates or duplicate dates.
std::map<Date, std::string> load_holidays_from_csv(std::istream& is);
std::map<Date, std::string> load_holidays_from_csv(const std::string& filepath);

// Interest tiers from CSV with header "min_days_late,daily_rate":
//   0,0.001
//   31,0.002
// Rates are parsed as exact decimals. Ordering is validated when the tiers
// are handed to InterestPolicy.
std::vector<InterestTier> load_tiers_from_csv(std::istream& is);
std::vector<InterestTier> load_tiers_from_csv(const std::string& filepath);

} // namespace io
} // namespace ledgercalc

#endif // LEDGERCALC_IO_TABLE_LOADER_HPP
