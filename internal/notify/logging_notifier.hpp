#pragma once

#include "internal/notify/change_notifier.hpp"

namespace infragraph::notify {

// Writes one info line per event.
class LoggingNotifier final : public ChangeNotifier {
 public:
  void Publish(const ChangeEvent& event) override;
};

} // namespace infragraph::notify
