#include "julesbot/observability/factory.hpp"

#include "julesbot/observability/log_observer.hpp"

namespace julesbot::observability {

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  return std::make_shared<LogObserver>(parse_log_level(config.log.level));
}

} // namespace julesbot::observability
