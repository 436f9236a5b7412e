#pragma once

#include "internal/notify/change_event.hpp"

namespace infragraph::notify {

/*
  Change notifier boundary.

  Publish() is called once per committed mutation and never before the
  owning transaction committed. Delivery is at-least-once; consumers must
  tolerate duplicates.
*/
class ChangeNotifier {
 public:
  virtual ~ChangeNotifier() = default;

  virtual void Publish(const ChangeEvent& event) = 0;
};

} // namespace infragraph::notify
