#pragma once

#include <string_view>

namespace tlsdial {

// Reports a caller bug (for instance polling an operation that already resolved) and aborts the process.
// Never returns: a contract violation is not a runtime condition that can be recovered from.
[[noreturn]] void ContractViolation(std::string_view what) noexcept;

}  // namespace tlsdial
