#pragma once
#include <cstddef>
#include <vector>

namespace hazard
{

struct Site
{
    int sid = 0;
    double lon = 0.0;
    double lat = 0.0;
    double vs30 = 760.0;
};

/// Ordered, immutable collection; `sid` equals the position of the site.
class SiteCollection
{
  public:
    SiteCollection() = default;
    explicit SiteCollection(std::vector<Site> sites);

    std::size_t size() const noexcept { return sites_.size(); }
    const Site& operator[](std::size_t i) const { return sites_.at(i); }
    auto begin() const noexcept { return sites_.begin(); }
    auto end() const noexcept { return sites_.end(); }

  private:
    std::vector<Site> sites_;
};

} // namespace hazard
