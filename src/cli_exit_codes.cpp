#include <cq/cli_exit_codes.h>

namespace cq {

int ReportExitCode(const Report &report) {
  return report.partial ? kExitPartial : kExitComplete;
}

} // namespace cq
