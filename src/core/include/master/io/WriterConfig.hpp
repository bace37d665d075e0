#pragma once
#include <cstddef>
#include <string>

/**
 * @file WriterConfig.hpp
 * @brief Configuration for writers (backend selection and async policy).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   WriterConfig cfg;
 *   cfg.backend = WriterConfig::Backend::Hdf5;
 *   cfg.path    = "out";   // file is out/<case>.h5
 * @endrst
 */

namespace disagg::master::io
{

struct WriterConfig
{
    enum class Backend
    {
        Hdf5,
        Null
    };

    Backend backend = Backend::Hdf5;
    std::string path = "out"; // case directory

    struct Async
    {
        bool enabled = false;
        std::size_t max_queue = 16;
    } async;
};

} // namespace disagg::master::io
