#include "master/io/Hdf5Writer.hpp"
#include "master/io/H5Id.hpp"
#include "master/Log.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <hdf5.h>

namespace disagg::master::io
{
namespace fs = std::filesystem;

/// \cond DOXYGEN_EXCLUDE

namespace
{

std::vector<std::string> split_path(const std::string& path)
{
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path)
    {
        if (c == '/')
        {
            if (!cur.empty())
                parts.push_back(std::move(cur));
            cur.clear();
        }
        else
            cur.push_back(c);
    }
    if (!cur.empty())
        parts.push_back(std::move(cur));
    return parts;
}

// Opens (creating when missing) the group made of parts[0..n)
H5Id ensure_group(hid_t file, const std::vector<std::string>& parts, std::size_t n)
{
    H5Id g = checked(H5Gopen2(file, "/", H5P_DEFAULT), H5Gclose, "open /");
    for (std::size_t i = 0; i < n; ++i)
    {
        const char* name = parts[i].c_str();
        const htri_t exists = H5Lexists(g, name, H5P_DEFAULT);
        check(exists, "H5Lexists " + parts[i]);
        hid_t next = exists > 0 ? H5Gopen2(g, name, H5P_DEFAULT)
                                : H5Gcreate2(g, name, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        g = checked(next, H5Gclose, "group " + parts[i]);
    }
    return g;
}

H5Id string_type(std::size_t len)
{
    H5Id t = checked(H5Tcopy(H5T_C_S1), H5Tclose, "string type");
    check(H5Tset_size(t, std::max<std::size_t>(1, len)), "H5Tset_size");
    check(H5Tset_strpad(t, H5T_STR_NULLPAD), "H5Tset_strpad");
    return t;
}

void write_attr(hid_t obj, const std::string& name, const AttrValue& value)
{
    const htri_t exists = H5Aexists(obj, name.c_str());
    check(exists, "H5Aexists " + name);
    if (exists > 0)
        check(H5Adelete(obj, name.c_str()), "H5Adelete " + name);

    auto create = [&](hid_t type, hid_t space)
    {
        return checked(H5Acreate2(obj, name.c_str(), type, space, H5P_DEFAULT, H5P_DEFAULT),
                       H5Aclose, "attribute " + name);
    };

    if (auto* i = std::get_if<std::int64_t>(&value))
    {
        H5Id sp = checked(H5Screate(H5S_SCALAR), H5Sclose, "scalar space");
        H5Id a = create(H5T_STD_I64LE, sp);
        check(H5Awrite(a, H5T_NATIVE_INT64, i), "write attribute " + name);
    }
    else if (auto* d = std::get_if<double>(&value))
    {
        H5Id sp = checked(H5Screate(H5S_SCALAR), H5Sclose, "scalar space");
        H5Id a = create(H5T_IEEE_F64LE, sp);
        check(H5Awrite(a, H5T_NATIVE_DOUBLE, d), "write attribute " + name);
    }
    else if (auto* s = std::get_if<std::string>(&value))
    {
        H5Id t = string_type(s->size());
        H5Id sp = checked(H5Screate(H5S_SCALAR), H5Sclose, "scalar space");
        H5Id a = create(t, sp);
        std::vector<char> buf(std::max<std::size_t>(1, s->size()), '\0');
        std::memcpy(buf.data(), s->data(), s->size());
        check(H5Awrite(a, t, buf.data()), "write attribute " + name);
    }
    else if (auto* v = std::get_if<std::vector<double>>(&value))
    {
        const hsize_t dims[1] = {v->size()};
        H5Id sp = checked(H5Screate_simple(1, dims, nullptr), H5Sclose, "attribute space");
        H5Id a = create(H5T_IEEE_F64LE, sp);
        if (!v->empty())
            check(H5Awrite(a, H5T_NATIVE_DOUBLE, v->data()), "write attribute " + name);
    }
    else if (auto* vs = std::get_if<std::vector<std::string>>(&value))
    {
        std::size_t len = 1;
        for (const auto& s2 : *vs)
            len = std::max(len, s2.size());
        std::vector<char> buf(len * vs->size(), '\0');
        for (std::size_t k = 0; k < vs->size(); ++k)
            std::memcpy(buf.data() + k * len, (*vs)[k].data(), (*vs)[k].size());
        H5Id t = string_type(len);
        const hsize_t dims[1] = {vs->size()};
        H5Id sp = checked(H5Screate_simple(1, dims, nullptr), H5Sclose, "attribute space");
        H5Id a = create(t, sp);
        if (!vs->empty())
            check(H5Awrite(a, t, buf.data()), "write attribute " + name);
    }
}

} // namespace

struct Hdf5Writer::Impl
{
    hid_t file = -1;
    std::string h5_path;
    std::size_t datasets = 0;
};

/// \endcond

Hdf5Writer::Hdf5Writer(WriterConfig cfg) : cfg_(std::move(cfg)), impl_(new Impl) {}

Hdf5Writer::~Hdf5Writer()
{
    std::lock_guard<std::mutex> lk(h5_mutex());
    if (impl_ && impl_->file >= 0)
    {
        H5Fclose(impl_->file);
        impl_->file = -1;
    }
}

const std::string& Hdf5Writer::file_path() const noexcept
{
    return impl_->h5_path;
}

void Hdf5Writer::open_case(const std::string& case_name)
{
    std::lock_guard<std::mutex> lk(h5_mutex());
    fs::create_directories(cfg_.path);
    impl_->h5_path = (fs::path(cfg_.path) / (case_name + ".h5")).string();
    impl_->file = H5Fcreate(impl_->h5_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (impl_->file < 0)
        throw std::runtime_error("Cannot create HDF5 file " + impl_->h5_path);
    impl_->datasets = 0;
    LOGD("[io] writing %s\n", impl_->h5_path.c_str());
}

void Hdf5Writer::write(const WriteRequest& req)
{
    std::lock_guard<std::mutex> lk(h5_mutex());
    if (impl_->file < 0)
        throw std::runtime_error("Hdf5Writer::write called before open_case");
    const auto parts = split_path(req.path);
    if (parts.empty())
        throw std::runtime_error("Hdf5Writer: empty object path");

    if (req.is_group())
    {
        H5Id g = ensure_group(impl_->file, parts, parts.size());
        for (const auto& [name, value] : req.attrs)
            write_attr(g, name, value);
        return;
    }

    H5Id parent = ensure_group(impl_->file, parts, parts.size() - 1);
    const std::string& leaf = parts.back();
    const htri_t exists = H5Lexists(parent, leaf.c_str(), H5P_DEFAULT);
    check(exists, "H5Lexists " + req.path);
    if (exists > 0)
        check(H5Ldelete(parent, leaf.c_str(), H5P_DEFAULT), "H5Ldelete " + req.path);

    std::vector<hsize_t> dims(req.shape.begin(), req.shape.end());
    std::size_t n = 1;
    for (auto d : req.shape)
        n *= d;
    H5Id space = checked(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr),
                         H5Sclose, "dataspace " + req.path);

    const bool ints = std::holds_alternative<std::vector<std::int64_t>>(req.data);
    const hid_t file_type = ints ? H5T_STD_I64LE : H5T_IEEE_F64LE;
    H5Id dset = checked(H5Dcreate2(parent, leaf.c_str(), file_type, space, H5P_DEFAULT,
                                   H5P_DEFAULT, H5P_DEFAULT),
                        H5Dclose, "create dataset " + req.path);
    if (ints)
    {
        const auto& v = std::get<std::vector<std::int64_t>>(req.data);
        if (v.size() != n)
            throw std::runtime_error("Hdf5Writer: size mismatch for " + req.path);
        if (n)
            check(H5Dwrite(dset, H5T_NATIVE_INT64, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data()),
                  "write " + req.path);
    }
    else
    {
        const auto& v = std::get<std::vector<double>>(req.data);
        if (v.size() != n)
            throw std::runtime_error("Hdf5Writer: size mismatch for " + req.path);
        if (n)
            check(H5Dwrite(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data()),
                  "write " + req.path);
    }
    for (const auto& [name, value] : req.attrs)
        write_attr(dset, name, value);
    ++impl_->datasets;
}

void Hdf5Writer::close()
{
    std::lock_guard<std::mutex> lk(h5_mutex());
    if (impl_ && impl_->file >= 0)
    {
        check(H5Fflush(impl_->file, H5F_SCOPE_GLOBAL), "flush " + impl_->h5_path);
        H5Fclose(impl_->file);
        impl_->file = -1;
        LOGD("[io] closed %s (%zu datasets)\n", impl_->h5_path.c_str(), impl_->datasets);
    }
}

} // namespace disagg::master::io
