#include "master/Reduce.hpp"
#include "master/Log.hpp"
#include "Probability.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <vector>

namespace disagg::master
{

namespace
{

void agg_probs_op(void* invec, void* inoutvec, int* len, MPI_Datatype*)
{
    const double* in = static_cast<const double*>(invec);
    double* inout = static_cast<double*>(inoutvec);
    for (int i = 0; i < *len; ++i)
        inout[i] = hazard::agg_probs(in[i], inout[i]);
}

constexpr std::size_t kChunk = std::size_t(1) << 26; // doubles per MPI_Reduce call

struct Flat
{
    std::size_t M, N, T, Ma;
    std::size_t operator()(std::size_t imti, std::size_t sid, std::size_t trti,
                           std::size_t magi) const
    {
        return ((imti * N + sid) * T + trti) * Ma + magi;
    }
};

} // namespace

hazard::Accumulator reduce_to_root(hazard::Accumulator local, const ReduceShape& shape,
                                   MPI_Comm comm)
{
    int size = 1, rank = 0;
    MPI_Comm_size(comm, &size);
    MPI_Comm_rank(comm, &rank);
    if (size == 1)
        return local;

    const Flat flat{shape.M, shape.N, shape.T, shape.Ma};
    const std::size_t nkeys = shape.M * shape.N * shape.T * shape.Ma;
    if (nkeys > std::size_t(INT_MAX))
        throw std::length_error("reduce_to_root: too many (imt, site, trt, mag) keys");

    std::vector<int> flags(nkeys, 0);
    for (const auto& [key, mats] : local.results())
        for (const auto& kv : mats)
            flags.at(flat(key.first, std::size_t(key.second), kv.first.first, kv.first.second)) =
                1;
    MPI_Allreduce(MPI_IN_PLACE, flags.data(), static_cast<int>(nkeys), MPI_INT, MPI_LOR, comm);

    std::vector<std::size_t> keys;
    for (std::size_t k = 0; k < nkeys; ++k)
        if (flags[k])
            keys.push_back(k);

    const std::size_t block = hazard::NdArray::element_count(shape.shape6);
    std::vector<double> send(keys.size() * block, 0.0);
    for (const auto& [key, mats] : local.results())
        for (const auto& [bin, mat] : mats)
        {
            if (mat.size() != block)
                throw std::length_error("reduce_to_root: matrix size mismatch");
            const std::size_t k = flat(key.first, std::size_t(key.second), bin.first, bin.second);
            const auto pos = std::lower_bound(keys.begin(), keys.end(), k) - keys.begin();
            std::copy(mat.data(), mat.data() + block, send.data() + std::size_t(pos) * block);
        }
    local.results().clear();

    std::vector<double> recv(rank == 0 ? send.size() : 0);
    MPI_Op op;
    MPI_Op_create(&agg_probs_op, 1, &op);
    for (std::size_t off = 0; off < send.size(); off += kChunk)
    {
        const int n = static_cast<int>(std::min(kChunk, send.size() - off));
        MPI_Reduce(send.data() + off, rank == 0 ? recv.data() + off : nullptr, n, MPI_DOUBLE, op,
                   0, comm);
    }
    MPI_Op_free(&op);

    hazard::Accumulator out;
    if (rank != 0)
        return out;
    for (std::size_t i = 0; i < keys.size(); ++i)
    {
        std::size_t k = keys[i];
        const std::size_t magi = k % shape.Ma;
        k /= shape.Ma;
        const std::size_t trti = k % shape.T;
        k /= shape.T;
        const std::size_t sid = k % shape.N;
        const std::size_t imti = k / shape.N;
        hazard::NdArray mat(shape.shape6);
        std::copy(recv.data() + i * block, recv.data() + (i + 1) * block, mat.data());
        out.add({imti, static_cast<int>(sid)}, {trti, magi}, mat);
    }
    LOGD("[reduce] %zu matrices combined over %d ranks\n", keys.size(), size);
    return out;
}

} // namespace disagg::master
