#include "beacon/matching/presets.h"

namespace beacon::matching {

int ScoringTables::tier_of(const std::string& institution) const {
  const auto it = institution_tiers.find(institution);
  return it != institution_tiers.end() ? it->second : default_tier;
}

namespace {

ScoringTables build_default_tables() {
  ScoringTables tables;

  tables.degree_prefixes = {"BS", "BA", "MBA", "PhD", "MD", "DO", "MFA", "MS", "MA"};

  // Tier 1
  for (const char* name :
       {"Harvard University", "Yale University", "Princeton University", "Columbia University",
        "University of Pennsylvania", "Cornell University", "Brown University", "Dartmouth College",
        "Stanford University", "MIT", "Caltech"}) {
    tables.institution_tiers.emplace(name, 1);
  }

  // Tier 2
  for (const char* name :
       {"Duke University", "Northwestern University", "Johns Hopkins University",
        "University of Chicago", "Rice University", "Vanderbilt University",
        "Washington University in St. Louis", "Notre Dame", "UC Berkeley", "UCLA",
        "Georgetown University"}) {
    tables.institution_tiers.emplace(name, 2);
  }

  // Tier 3
  for (const char* name :
       {"University of Michigan", "University of Virginia", "University of North Carolina",
        "Georgia Tech", "University of Texas at Austin", "University of Wisconsin",
        "University of Illinois", "Ohio State University", "Penn State University",
        "University of Washington", "University of Florida", "Purdue University", "UC San Diego",
        "University of Maryland"}) {
    tables.institution_tiers.emplace(name, 3);
  }

  tables.default_tier = 4;

  tables.seeker_weights = {
      {domain::FactorId::kSharedInstitution, 2.0}, {domain::FactorId::kInstitutionTier, 1.0},
      {domain::FactorId::kIndustryAlignment, 5.0}, {domain::FactorId::kHelpTypeMatch, 5.0},
      {domain::FactorId::kLocationProximity, 2.0}, {domain::FactorId::kExperienceGap, 4.0},
      {domain::FactorId::kGpa, 0.0},
  };

  return tables;
}

}  // namespace

const ScoringTables& default_scoring_tables() {
  static const ScoringTables kTables = build_default_tables();
  return kTables;
}

}  // namespace beacon::matching
