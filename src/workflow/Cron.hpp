#pragma once

#include <string>

namespace weft {
namespace workflow {

/**
 * Check a cron expression
 *
 * Accepts 5 fields (minute hour day-of-month month day-of-week), an
 * optional 6th seconds field, and the @yearly/@annually/@monthly/@weekly/
 * @daily/@midnight/@hourly shortcuts. Each field is '*', a value, a range
 * a-b, a list, or any of those with a /step. Month and weekday names
 * (jan..dec, sun..sat) are accepted.
 */
bool isValidCron(const std::string& expression);

} // namespace workflow
} // namespace weft
