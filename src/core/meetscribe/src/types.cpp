#include "meetscribe/types.hpp"

#include <cmath>

using namespace std;


namespace meetscribe
{

string profile_status_string(ProfileStatus status)
{
  switch (status) {
    case ProfileStatus::CREATED:
      return "created";
    case ProfileStatus::ENROLLING:
      return "enrolling";
    case ProfileStatus::ENROLLED:
      return "enrolled";
    case ProfileStatus::FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

double cosine_similarity(const vector<float> & a, const vector<float> & b)
{
  if (a.empty() || a.size() != b.size()) {
    return 0.0;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a <= 0.0 || norm_b <= 0.0) {
    return 0.0;
  }
  return dot / (sqrt(norm_a) * sqrt(norm_b));
}

}  // namespace meetscribe
