#pragma once

#include "beacon/domain/profile.h"

#include <string>
#include <vector>

namespace beacon::testing {

// Eight years of experience, Stanford (tier 1), San Francisco. Ranks industry
// and help type first; every other axis is left unranked.
inline domain::Provider make_provider(const std::string& id = "p-1") {
  domain::Provider provider;
  provider.provider_id = core::ProviderId{id};
  provider.name = "Dana Mentor";
  provider.current_role = "Engineering Manager";
  provider.current_employer = "Google";
  provider.current_industry = "Technology";
  provider.location = "San Francisco, CA";
  provider.help_offered = {"Resume Review", "Interview Prep", "Career Switch"};
  provider.help_details = "Moved from IC to management";
  provider.past_positions = {
      {"Senior Engineer", "Google", "5 years", false, 0},
      {"Engineer", "Meta", "3 years", false, 1},
      {"BS Computer Science", "Stanford University", "4 years", false, 2},
  };
  provider.preferences.industry = 1;
  provider.preferences.help_type = 1;
  return provider;
}

// Two years of experience, UC Berkeley (tier 2), Oakland. Shares one of two
// help needs with make_provider().
inline domain::Seeker make_seeker(const std::string& id = "s-1") {
  domain::Seeker seeker;
  seeker.seeker_id = core::SeekerId{id};
  seeker.name = "Sam Seeker";
  seeker.current_role = "Analyst";
  seeker.current_employer = "Acme";
  seeker.current_industry = "Technology";
  seeker.location = "Oakland, CA";
  seeker.help_needed = {"Resume Review", "Networking"};
  seeker.gpa = 3.6;
  seeker.goal = "Become a product manager";
  seeker.context = "Looking to move into PM within two years";
  seeker.past_positions = {
      {"Analyst", "Acme", "2 years", false, 0},
      {"BS Economics", "UC Berkeley", "4 years", false, 1},
  };
  return seeker;
}

}  // namespace beacon::testing
