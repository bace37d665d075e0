#include "master/io/Preflight.hpp"
#include "PmfExtractor.hpp"
#include <array>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace disagg::master::io
{

std::string humansize(double nbytes)
{
    static const std::array<const char*, 6> units{"B", "KB", "MB", "GB", "TB", "PB"};
    std::size_t u = 0;
    while (nbytes >= 1024.0 && u + 1 < units.size())
    {
        nbytes /= 1024.0;
        ++u;
    }
    char buf[64];
    if (u == 0)
        std::snprintf(buf, sizeof(buf), "%.0f %s", nbytes, units[u]);
    else
        std::snprintf(buf, sizeof(buf), "%.2f %s", nbytes, units[u]);
    return buf;
}

double estimate_transfer(const hazard::ShapeDic& shape, std::size_t num_tasks)
{
    return 8.0 * double(shape.dist) * double(shape.lon) * double(shape.lat) * double(shape.eps) *
           double(shape.N) * double(shape.P) * double(shape.Z) * double(num_tasks);
}

std::map<std::string, double> outputs_size(const hazard::ShapeDic& shape,
                                           const std::vector<std::string>& outputs)
{
    const auto& names = outputs.empty() ? hazard::pmf_names() : outputs;
    const double per_output =
        double(shape.N) * double(shape.M) * double(shape.P) * double(shape.Z);
    std::map<std::string, double> tot;
    for (const auto& out : names)
    {
        double nbytes = 8.0;
        std::string key;
        auto flush = [&]
        {
            if (!key.empty())
                nbytes *= double(shape.get(key));
            key.clear();
        };
        for (char c : out)
        {
            if (c == '_')
                flush();
            else
                key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        flush();
        tot[out] = nbytes * per_output;
    }
    return tot;
}

std::pair<bool, std::string> run_preflight(const hazard::ShapeDic& shape, std::size_t num_tasks,
                                           double max_data_transfer)
{
    const double nbytes = estimate_transfer(shape, num_tasks);

    std::ostringstream msg;
    msg << "dist=" << shape.dist << " x lon=" << shape.lon << " x lat=" << shape.lat
        << " x eps=" << shape.eps << " x N=" << shape.N << " x P=" << shape.P
        << " x Z=" << shape.Z << " x tasks=" << num_tasks << " x 8 bytes = " << humansize(nbytes);

    const bool ok = nbytes <= max_data_transfer;
    if (!ok)
        msg << " > max_data_transfer=" << humansize(max_data_transfer);
    return {ok, msg.str()};
}

} // namespace disagg::master::io
