#include "tlsdial/contract-violation.hpp"

#include <cstdlib>
#include <string_view>

#include "tlsdial/log.hpp"

namespace tlsdial {

void ContractViolation(std::string_view what) noexcept {
  log::critical("Contract violation: {}", what);
  log::default_logger_raw()->flush();
  std::abort();
}

}  // namespace tlsdial
