// optimization mode names

#include "scheduleTypes.h"
#include "scheduleErrors.h"

#include <algorithm>
#include <cctype>

OptimizationMode parseOptimizationMode(const std::string& mode) {

  std::string name = mode;
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c){return std::tolower(c);});

  if (name == "cost") {
    return(OptimizationMode::Cost);
  }
  if (name == "carbon") {
    return(OptimizationMode::Carbon);
  }

  throw InvalidInputError("unknown optimization mode '" + mode + "', expected 'cost' or 'carbon'");

}

std::string optimizationModeName(OptimizationMode mode) {

  switch (mode) {
  case OptimizationMode::Cost:
    return("cost");
  case OptimizationMode::Carbon:
    return("carbon");
  }

  return("unknown");

}
