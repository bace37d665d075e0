#include "Site.hpp"
#include "Errors.hpp"
#include <string>

namespace hazard
{

SiteCollection::SiteCollection(std::vector<Site> sites) : sites_(std::move(sites))
{
    for (std::size_t i = 0; i < sites_.size(); ++i)
        if (sites_[i].sid != static_cast<int>(i))
            throw ConfigError("Site ids must be 0..N-1 in order; found sid=" +
                              std::to_string(sites_[i].sid) + " at position " +
                              std::to_string(i));
}

} // namespace hazard
