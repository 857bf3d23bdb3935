#pragma once

namespace beacon::matching {

// estimate_acceptance buckets a seeker-perspective score (0-100) into the
// estimated probability that the seeker accepts a connection request.
[[nodiscard]] double estimate_acceptance(double seeker_score);

}  // namespace beacon::matching
