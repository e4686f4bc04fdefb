#pragma once

#include "common/Types.hpp"

namespace relay::queue {

/// The single ordering rule for dispatch: Premium before Free, then arrival order
/// (FIFO) within a tier. Returns true if tjA must be dispatched before tjB.
bool dispatchesBefore(const common::TransferJob& tjA, const common::TransferJob& tjB);

}  // namespace relay::queue
