#pragma once

#include "matrixforge/environment/environment_set.hpp"
#include "matrixforge/record/build_record.hpp"
#include "matrixforge/scheduler/job.hpp"

#include <memory>

namespace matrixforge {

// A job the fan-out coordinator schedules once per environment. Its builds
// share the number of the coordinating build.
class IChildJob : public IJob {
public:
  [[nodiscard]] virtual auto environment() const -> const EnvironmentSet & = 0;

  /// Started (running or finished) build with this number, if any.
  [[nodiscard]] virtual auto build_by_number(int number) const
      -> std::shared_ptr<BuildRecord> = 0;
};

} // namespace matrixforge
