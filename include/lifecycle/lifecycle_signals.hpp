#ifndef WEBIMG_LIFECYCLE_SIGNALS_HPP
#define WEBIMG_LIFECYCLE_SIGNALS_HPP

#include <boost/signals2/signal.hpp>

namespace webimg {
namespace lifecycle {

// Process lifecycle notifications. The application raises them from whatever
// platform hook it has; the cache and downloader connect to the ones they
// care about and never learn where they came from.
class LifecycleSignals {
public:
  using Signal = boost::signals2::signal<void()>;

  LifecycleSignals() = default;
  LifecycleSignals(const LifecycleSignals&) = delete;
  LifecycleSignals& operator=(const LifecycleSignals&) = delete;

  // Low memory: caches drop their in-memory tier
  Signal memory_pressure;
  // Process about to be suspended: transfers not allowed to continue stop
  Signal process_suspending;
  // Background time granted after suspension ran out
  Signal background_time_expired;
  // Process moved to background: good moment for disk maintenance
  Signal entered_background;
  // Process about to exit
  Signal terminating;
};

} // namespace lifecycle
} // namespace webimg

#endif // WEBIMG_LIFECYCLE_SIGNALS_HPP
