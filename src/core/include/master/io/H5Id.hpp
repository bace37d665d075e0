#pragma once
#include <hdf5.h>
#include <mutex>
#include <stdexcept>
#include <string>

namespace disagg::master::io
{

/// Owning HDF5 identifier; `closer` matches the object kind (H5Fclose, H5Dclose, ...).
struct H5Id
{
    hid_t id = -1;
    herr_t (*closer)(hid_t) = nullptr;

    H5Id() = default;
    H5Id(hid_t i, herr_t (*c)(hid_t)) : id(i), closer(c) {}
    H5Id(const H5Id&) = delete;
    H5Id& operator=(const H5Id&) = delete;
    H5Id(H5Id&& o) noexcept : id(o.id), closer(o.closer) { o.id = -1; }
    H5Id& operator=(H5Id&& o) noexcept
    {
        if (this != &o)
        {
            reset();
            id = o.id;
            closer = o.closer;
            o.id = -1;
        }
        return *this;
    }
    ~H5Id() { reset(); }

    void reset() noexcept
    {
        if (id >= 0 && closer)
            closer(id);
        id = -1;
    }
    operator hid_t() const noexcept { return id; }
};

// Serialises every HDF5 call of the process: the serial library is not thread safe.
inline std::mutex& h5_mutex()
{
    static std::mutex m;
    return m;
}

inline void check(herr_t rc, const std::string& what)
{
    if (rc < 0)
        throw std::runtime_error("HDF5 error: " + what);
}

inline H5Id checked(hid_t id, herr_t (*closer)(hid_t), const std::string& what)
{
    if (id < 0)
        throw std::runtime_error("HDF5 error: " + what);
    return H5Id(id, closer);
}

} // namespace disagg::master::io
