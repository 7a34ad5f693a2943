#pragma once

#include <cq/models.h>

namespace cq {

constexpr int kExitComplete = 0;
constexpr int kExitError = 1;
constexpr int kExitPartial = 2;

int ReportExitCode(const Report &report);

} // namespace cq
