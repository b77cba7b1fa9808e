#pragma once

#include <cstddef>

namespace hm::engine
{

class JobStore;

// Rebuilds the combined job listing from all per-job overviews.
class OverviewAggregator
{
  public:
    explicit OverviewAggregator(JobStore &store);

    // Reads every per-job overview, concatenates their "jobs" arrays and
    // publishes the result. Unparseable overviews are logged and left out.
    // Returns the number of jobs in the published listing.
    std::size_t rebuild();

  private:
    JobStore &store_;
};

} // namespace hm::engine
