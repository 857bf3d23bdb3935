#include "beacon/matching/acceptance.h"

#include <array>
#include <utility>

namespace beacon::matching {

namespace {

// (minimum seeker score, probability), highest bucket first.
constexpr std::array<std::pair<double, double>, 6> kAcceptanceBuckets{{
    {90.0, 0.95},
    {80.0, 0.85},
    {70.0, 0.70},
    {60.0, 0.50},
    {50.0, 0.30},
    {40.0, 0.20},
}};

constexpr double kFloorProbability = 0.10;

}  // namespace

double estimate_acceptance(double seeker_score) {
  for (const auto& [threshold, probability] : kAcceptanceBuckets) {
    if (seeker_score >= threshold) {
      return probability;
    }
  }
  return kFloorProbability;
}

}  // namespace beacon::matching
