#include "beacon/goals/goal_prompt.h"

#include <sstream>

namespace beacon::goals {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += separator;
    }
    out += item;
  }
  return out;
}

}  // namespace

std::string career_path(const domain::Provider& provider,
                        const matching::ProfileNormalizer& normalizer) {
  std::vector<std::string> steps;
  for (const auto& position : provider.past_positions) {
    if (normalizer.is_education(position)) {
      continue;
    }
    steps.push_back(position.title + " at " + position.organization);
  }
  return join(steps, " → ");
}

std::string build_goal_prompt(const domain::Provider& provider, const domain::Seeker& seeker,
                              const matching::ProfileNormalizer& normalizer) {
  std::ostringstream prompt;
  prompt << "You are a career matching expert. Rate how well this MENTOR can help this MENTEE "
            "achieve their goal.\n\n";

  prompt << "MENTEE PROFILE:\n";
  prompt << "Name: " << seeker.name << "\n";
  prompt << "Goal: " << seeker.goal << "\n";
  prompt << "Context: " << seeker.context << "\n";
  prompt << "Current Role: " << seeker.current_role << " at " << seeker.current_employer << "\n";
  prompt << "Industry: " << seeker.current_industry << "\n";
  prompt << "Needs Help With: " << join(seeker.help_needed, ", ") << "\n\n";

  prompt << "MENTOR PROFILE:\n";
  prompt << "Name: " << provider.name << "\n";
  prompt << "Current Role: " << provider.current_role << " at " << provider.current_employer
         << "\n";
  prompt << "Industry: " << provider.current_industry << "\n";
  prompt << "Can Help With: " << join(provider.help_offered, ", ") << "\n";
  prompt << "Additional Context: " << provider.help_details << "\n";
  prompt << "Career Path: " << career_path(provider, normalizer) << "\n\n";

  prompt << "TASK:\n"
            "Rate from 0.0 to 1.0 how well this mentor can help the mentee achieve their "
            "specific goal.\n\n"
            "Consider:\n"
            "1. Does the mentor have direct experience in the mentee's target role/industry?\n"
            "2. Has the mentor made a similar career transition?\n"
            "3. Can the mentor provide the specific help the mentee needs?\n"
            "4. Does the mentor's background align with the mentee's aspirations?\n\n"
            "Return ONLY a JSON object with this exact format (no markdown, no explanation):\n"
            R"({"score": 0.75, "reasoning": "Brief explanation in 1-2 sentences"})";

  return prompt.str();
}

}  // namespace beacon::goals
