#include "store/Hdf5RuptureStore.hpp"
#include "Errors.hpp"
#include "master/Log.hpp"
#include "master/io/H5Id.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <mutex>
#include <numeric>
#include <stdexcept>

namespace disagg::store
{

using master::io::check;
using master::io::checked;
using master::io::H5Id;
using master::io::h5_mutex;

/// \cond DOXYGEN_EXCLUDE

namespace
{

bool exists(hid_t loc, const std::string& path)
{
    // walk the path so that a missing intermediate group is not an error
    std::string cur;
    std::size_t pos = 0;
    while (pos <= path.size())
    {
        const std::size_t next = path.find('/', pos);
        cur = path.substr(0, next);
        if (!cur.empty())
        {
            const htri_t e = H5Lexists(loc, cur.c_str(), H5P_DEFAULT);
            check(e, "H5Lexists " + cur);
            if (e == 0)
                return false;
        }
        if (next == std::string::npos)
            break;
        pos = next + 1;
    }
    return true;
}

H5Id open_dataset(hid_t file, const std::string& path)
{
    if (!exists(file, path))
        throw hazard::DataError("Missing dataset in rupture store: " + path);
    return checked(H5Dopen2(file, path.c_str(), H5P_DEFAULT), H5Dclose, "open " + path);
}

std::vector<hsize_t> dims_of(hid_t dset)
{
    H5Id space = checked(H5Dget_space(dset), H5Sclose, "dataspace");
    const int nd = H5Sget_simple_extent_ndims(space);
    check(nd, "ndims");
    std::vector<hsize_t> dims(static_cast<std::size_t>(nd));
    if (nd > 0)
        check(H5Sget_simple_extent_dims(space, dims.data(), nullptr), "dims");
    return dims;
}

std::vector<double> read_doubles(hid_t file, const std::string& path,
                                 std::vector<hsize_t>* shape = nullptr)
{
    H5Id d = open_dataset(file, path);
    const auto dims = dims_of(d);
    std::size_t n = 1;
    for (auto x : dims)
        n *= x;
    std::vector<double> v(n);
    if (n)
        check(H5Dread(d, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data()),
              "read " + path);
    if (shape)
        *shape = dims;
    return v;
}

std::vector<int> read_ints(hid_t file, const std::string& path)
{
    H5Id d = open_dataset(file, path);
    const auto dims = dims_of(d);
    std::size_t n = 1;
    for (auto x : dims)
        n *= x;
    std::vector<int> v(n);
    if (n)
        check(H5Dread(d, H5T_NATIVE_INT, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data()),
              "read " + path);
    return v;
}

std::vector<std::string> read_strings(hid_t file, const std::string& path)
{
    H5Id d = open_dataset(file, path);
    H5Id ftype = checked(H5Dget_type(d), H5Tclose, "type " + path);
    if (H5Tget_class(ftype) != H5T_STRING || H5Tis_variable_str(ftype) > 0)
        throw hazard::DataError(path + " must hold fixed-length strings");
    const std::size_t len = H5Tget_size(ftype);
    const auto dims = dims_of(d);
    const std::size_t n = dims.empty() ? 1 : dims[0];

    H5Id mtype = checked(H5Tcopy(H5T_C_S1), H5Tclose, "string type");
    check(H5Tset_size(mtype, len), "H5Tset_size");
    check(H5Tset_strpad(mtype, H5T_STR_NULLPAD), "H5Tset_strpad");
    std::vector<char> buf(len * n, '\0');
    if (n)
        check(H5Dread(d, mtype, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data()), "read " + path);

    std::vector<std::string> out;
    for (std::size_t i = 0; i < n; ++i)
    {
        const char* s = buf.data() + i * len;
        out.emplace_back(s, strnlen(s, len));
    }
    return out;
}

std::vector<std::string> link_names(hid_t file, const std::string& group)
{
    H5Id g = checked(H5Gopen2(file, group.c_str(), H5P_DEFAULT), H5Gclose, "open " + group);
    H5G_info_t info;
    check(H5Gget_info(g, &info), "H5Gget_info " + group);
    std::vector<std::string> names;
    for (hsize_t i = 0; i < info.nlinks; ++i)
    {
        const ssize_t len = H5Lget_name_by_idx(g, ".", H5_INDEX_NAME, H5_ITER_INC, i, nullptr,
                                               0, H5P_DEFAULT);
        if (len < 0)
            throw std::runtime_error("HDF5 error: link name in " + group);
        std::string name(static_cast<std::size_t>(len), '\0');
        if (H5Lget_name_by_idx(g, ".", H5_INDEX_NAME, H5_ITER_INC, i, name.data(),
                               static_cast<std::size_t>(len) + 1, H5P_DEFAULT) < 0)
            throw std::runtime_error("HDF5 error: link name in " + group);
        names.push_back(std::move(name));
    }
    return names;
}

class Hdf5RuptureReader final : public hazard::IRuptureReader
{
  public:
    explicit Hdf5RuptureReader(const std::string& path)
    {
        std::lock_guard<std::mutex> lk(h5_mutex());
        file_ = checked(H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose,
                        "open " + path);
        for (auto& name : link_names(file_, "rup"))
            if (name != "grp_id")
                columns_.push_back(std::move(name));
    }

    ~Hdf5RuptureReader() override
    {
        std::lock_guard<std::mutex> lk(h5_mutex());
        file_.reset();
    }

    hazard::RuptureColumns read(std::span<const std::size_t> idxs) override
    {
        // rows come back in file order; keep the caller's order through `order`
        std::vector<std::size_t> order(idxs.size());
        std::iota(order.begin(), order.end(), std::size_t(0));
        std::sort(order.begin(), order.end(),
                  [&](std::size_t a, std::size_t b) { return idxs[a] < idxs[b]; });
        for (std::size_t i = 1; i < order.size(); ++i)
            if (idxs[order[i]] == idxs[order[i - 1]])
                throw std::invalid_argument("rupture reader: duplicated index");

        hazard::RuptureColumns cols;
        std::lock_guard<std::mutex> lk(h5_mutex());
        for (const auto& name : columns_)
        {
            const std::string path = "rup/" + name;
            H5Id d = open_dataset(file_, path);
            const auto dims = dims_of(d);
            if (dims.empty() || dims.size() > 2)
                throw hazard::DataError(path + " must be 1-D or 2-D");
            const hsize_t ncols = dims.size() == 2 ? dims[1] : 1;

            H5Id fspace = checked(H5Dget_space(d), H5Sclose, "dataspace " + path);
            check(H5Sselect_none(fspace), "select none");
            for (std::size_t k : order)
            {
                const hsize_t u = idxs[k];
                if (u >= dims[0])
                    throw std::out_of_range("rupture index outside " + path);
                const hsize_t start[2] = {u, 0};
                const hsize_t count[2] = {1, ncols};
                check(H5Sselect_hyperslab(fspace, H5S_SELECT_OR, start, nullptr, count, nullptr),
                      "select " + path);
            }
            const hsize_t mdims[1] = {hsize_t(idxs.size()) * ncols};
            H5Id mspace = checked(H5Screate_simple(1, mdims, nullptr), H5Sclose, "memspace");
            std::vector<double> sorted(idxs.size() * ncols);
            if (!sorted.empty())
                check(H5Dread(d, H5T_NATIVE_DOUBLE, mspace, fspace, H5P_DEFAULT, sorted.data()),
                      "read " + path);

            hazard::Column col;
            col.ncols = static_cast<std::size_t>(ncols);
            col.values.resize(sorted.size());
            for (std::size_t i = 0; i < order.size(); ++i)
                std::copy_n(sorted.data() + i * col.ncols, col.ncols,
                            col.values.data() + order[i] * col.ncols);
            cols.emplace(name, std::move(col));
        }
        return cols;
    }

  private:
    H5Id file_;
    std::vector<std::string> columns_;
};

} // namespace

/// \endcond

std::unique_ptr<Hdf5RuptureStore> Hdf5RuptureStore::open(const std::string& path)
{
    return std::unique_ptr<Hdf5RuptureStore>(new Hdf5RuptureStore(path));
}

Hdf5RuptureStore::Hdf5RuptureStore(std::string path) : path_(std::move(path))
{
    std::lock_guard<std::mutex> lk(h5_mutex());
    file_ = H5Fopen(path_.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_ < 0)
        throw std::runtime_error("Cannot open rupture store " + path_);
    H5Id guard(file_, H5Fclose); // closes the file if loading throws

    const auto sids = read_ints(file_, "sitecol/sids");
    const auto lons = read_doubles(file_, "sitecol/lons");
    const auto lats = read_doubles(file_, "sitecol/lats");
    const auto vs30 = read_doubles(file_, "sitecol/vs30");
    if (lons.size() != sids.size() || lats.size() != sids.size() || vs30.size() != sids.size())
        throw hazard::DataError("sitecol datasets have different lengths");
    std::vector<hazard::Site> sites;
    for (std::size_t i = 0; i < sids.size(); ++i)
        sites.push_back({sids[i], lons[i], lats[i], vs30[i]});
    sites_ = hazard::SiteCollection(std::move(sites));

    trts_ = read_strings(file_, "full_lt/trts");
    for (const auto& trt : trts_)
    {
        const std::string p = "source_mags/" + trt;
        mags_by_trt_.emplace_back(trt, exists(file_, p) ? read_doubles(file_, p)
                                                        : std::vector<double>{});
    }

    for (int t : read_ints(file_, "full_lt/grp_trt"))
    {
        if (t < 0 || static_cast<std::size_t>(t) >= trts_.size())
            throw hazard::DataError("full_lt/grp_trt refers to an unknown TRT");
        grp_trt_.push_back(static_cast<std::size_t>(t));
    }
    for (std::size_t g = 0; g < grp_trt_.size(); ++g)
    {
        const std::string grp = "full_lt/rlzs_by_grp/grp-" + std::to_string(g);
        hazard::RlzsByGsim rbg;
        if (exists(file_, grp))
            for (const auto& gsim : link_names(file_, grp))
                rbg.emplace_back(gsim, read_ints(file_, grp + "/" + gsim));
        rlzs_by_grp_.push_back(std::move(rbg));
    }

    std::vector<hsize_t> wshape;
    weights_ = read_doubles(file_, "full_lt/weights", &wshape);
    num_rlzs_ = wshape.empty() ? 0 : static_cast<std::size_t>(wshape[0]);
    weight_cols_ = wshape.size() == 2 ? static_cast<std::size_t>(wshape[1]) : 1;

    mags_ = read_doubles(file_, "rup/mag");
    grp_ids_ = read_ints(file_, "rup/grp_id");
    if (mags_.size() != grp_ids_.size())
        throw hazard::DataError("rup/mag and rup/grp_id have different lengths");

    const htri_t has_atomic = H5Aexists(file_, "atomic");
    check(has_atomic, "H5Aexists atomic");
    if (has_atomic > 0)
    {
        H5Id a = checked(H5Aopen(file_, "atomic", H5P_DEFAULT), H5Aclose, "open attribute");
        int v = 0;
        check(H5Aread(a, H5T_NATIVE_INT, &v), "read attribute atomic");
        atomic_ = v != 0;
    }

    guard.id = -1; // keep the file open
    LOGD("[store] %s: %zu sites, %zu ruptures, %zu groups, %zu realizations\n", path_.c_str(),
         sites_.size(), mags_.size(), grp_trt_.size(), num_rlzs_);
}

Hdf5RuptureStore::~Hdf5RuptureStore()
{
    std::lock_guard<std::mutex> lk(h5_mutex());
    if (file_ >= 0)
        H5Fclose(file_);
}

hazard::NdArray Hdf5RuptureStore::weights(const hazard::Imtls& imtls) const
{
    const std::size_t M = imtls.size();
    if (weight_cols_ != 1 && weight_cols_ != M)
        throw hazard::DataError("full_lt/weights has " + std::to_string(weight_cols_) +
                                " columns but there are " + std::to_string(M) + " IMTs");
    hazard::NdArray w({num_rlzs_, M});
    for (std::size_t r = 0; r < num_rlzs_; ++r)
        for (std::size_t m = 0; m < M; ++m)
            w.at({r, m}) = weights_[r * weight_cols_ + (weight_cols_ == 1 ? 0 : m)];
    return w;
}

std::optional<std::vector<double>> Hdf5RuptureStore::read_curve_row(const std::string& path,
                                                                    int sid) const
{
    std::lock_guard<std::mutex> lk(h5_mutex());
    if (!exists(file_, path))
        return std::nullopt;
    H5Id d = open_dataset(file_, path);
    const auto dims = dims_of(d);
    if (dims.size() != 2)
        throw hazard::DataError(path + " must be 2-D (sites, levels)");
    if (sid < 0 || hsize_t(sid) >= dims[0])
        return std::nullopt;

    H5Id fspace = checked(H5Dget_space(d), H5Sclose, "dataspace " + path);
    const hsize_t start[2] = {hsize_t(sid), 0};
    const hsize_t count[2] = {1, dims[1]};
    check(H5Sselect_hyperslab(fspace, H5S_SELECT_SET, start, nullptr, count, nullptr),
          "select " + path);
    H5Id mspace = checked(H5Screate_simple(1, &dims[1], nullptr), H5Sclose, "memspace");
    std::vector<double> row(dims[1]);
    check(H5Dread(d, H5T_NATIVE_DOUBLE, mspace, fspace, H5P_DEFAULT, row.data()),
          "read " + path);
    if (std::any_of(row.begin(), row.end(), [](double x) { return std::isnan(x); }))
        return std::nullopt;
    return row;
}

std::optional<std::vector<double>> Hdf5RuptureStore::curve(int sid, int rlz) const
{
    return read_curve_row("hcurves/rlz-" + std::to_string(rlz), sid);
}

std::optional<std::vector<double>> Hdf5RuptureStore::group_curve(int sid, int rlz,
                                                                 std::size_t gidx) const
{
    return read_curve_row("pcurves/grp-" + std::to_string(gidx) + "/rlz-" + std::to_string(rlz),
                          sid);
}

std::unique_ptr<hazard::IRuptureReader> Hdf5RuptureStore::open_reader() const
{
    return std::make_unique<Hdf5RuptureReader>(path_);
}

} // namespace disagg::store
