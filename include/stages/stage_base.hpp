#pragma once
#include "common/types.hpp"

namespace routeopt {

// Every pipeline step is a Stage; inputs and outputs travel through the
// request-scoped RoutingContext, so a stage can be swapped without touching
// its neighbours as long as it reads and writes the same ctx fields.
class IStage {
public:
  virtual ~IStage() = default;
  virtual const char* Name() const = 0;
  virtual void Run(RoutingContext& ctx) = 0;
};

} // namespace routeopt
