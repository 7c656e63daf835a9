// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_APP_NOTIFIER_HPP
#define RUNLIFT_APP_NOTIFIER_HPP

#include <string>
#include <vector>

namespace runlift {
namespace app {

/**
 * Destination for cycle outcomes and setup alerts.
 *
 * Implementations report delivery problems through logging only; a
 * notification failure never fails an upload cycle.
 */
class INotifier {
public:
  virtual ~INotifier() = default;

  /**
   * Report the run ids uploaded in full and those left with failures.
   * Called at most once per cycle, and only when at least one list is
   * non-empty.
   */
  virtual void notifyRunSummary(
    const std::vector<std::string>& completed, const std::vector<std::string>& failed
  ) = 0;

  /**
   * Report a setup problem (credentials, bucket access).
   */
  virtual void alert(const std::string& message) = 0;
};

}  // namespace app
}  // namespace runlift

#endif  // RUNLIFT_APP_NOTIFIER_HPP
