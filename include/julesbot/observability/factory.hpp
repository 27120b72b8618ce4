#pragma once

#include "julesbot/config/schema.hpp"
#include "julesbot/observability/observer.hpp"

#include <memory>

namespace julesbot::observability {

[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

} // namespace julesbot::observability
