#pragma once
#include <stdexcept>

/**
 * @file Errors.hpp
 * @brief Error categories raised by the disaggregation pipeline.
 *
 * @details
 * - :cpp:struct:`hazard::ConfigError` is fatal and raised before any task runs (limits on sites,
 *   matrix size, data transfer, invalid settings).
 * - :cpp:struct:`hazard::DataError` is fatal and raised when the hazard model cannot support the
 *   requested disaggregation at any site.
 *
 * Degraded data and numerical inconsistencies are reported through ``LOGW`` and do not throw.
 */

namespace hazard
{

struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct DataError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

} // namespace hazard
