#pragma once

#include <string>

namespace beacon::domain {

// PastPosition is one entry of a profile's history: a job, or a degree when
// the title carries a degree prefix ("BS Computer Science", "MBA").
// For degree entries, organization holds the institution name.
struct PastPosition {
  std::string title;
  std::string organization;
  std::string duration;  // free text: "3 years", "18 months"
  bool is_education{false};  // NOLINT(readability-identifier-naming)
  int order{0};              // chronological/display order key
};

}  // namespace beacon::domain
