#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "BinEdges.hpp"

/**
 * @file Preflight.hpp
 * @brief Size checks run before any disaggregation task is submitted.
 *
 * @details
 * Estimates the bytes every task sends back to the reducer and the bytes written for the
 * requested outputs. The data-transfer estimate is a hard ceiling; the output size is only
 * reported.
 *
 * @rst
 * .. math::
 *
 *    \mathrm{transfer} = 8 \cdot D \cdot Lo \cdot La \cdot E \cdot N \cdot P \cdot Z
 *                        \cdot \mathrm{tasks}
 *
 * .. math::
 *
 *    \mathrm{size}(o) = 8 \cdot \prod_{k \in o} \mathrm{shape}[k] \cdot N \cdot M \cdot P
 *                       \cdot Z
 *
 * where ``k`` runs over the lower-cased ``_``-separated parts of the output name.
 * @endrst
 *
 * @return `{ok, message}` where `message` spells out the factors of the estimate.
 */

namespace disagg::master::io
{

// "512 B", "1.50 KB", "2.00 GB", ...
std::string humansize(double nbytes);

// Bytes sent back by `num_tasks` tasks
double estimate_transfer(const hazard::ShapeDic& shape, std::size_t num_tasks);

// Output name -> bytes; empty `outputs` means all PMFs
std::map<std::string, double> outputs_size(const hazard::ShapeDic& shape,
                                           const std::vector<std::string>& outputs);

// Returns {ok, message}; ok=false when the estimate exceeds max_data_transfer
std::pair<bool, std::string> run_preflight(const hazard::ShapeDic& shape, std::size_t num_tasks,
                                           double max_data_transfer);

} // namespace disagg::master::io
