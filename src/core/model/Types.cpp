#include "Types.hpp"

#include <ctime>

namespace sai {

const char* to_string(SubmissionStatus s) {
  switch (s) {
    case SubmissionStatus::Pending:    return "pending";
    case SubmissionStatus::Processing: return "processing";
    case SubmissionStatus::Completed:  return "completed";
    case SubmissionStatus::Failed:     return "failed";
  }
  return "pending";
}

std::optional<SubmissionStatus> status_from_string(std::string_view s) {
  if (s == "pending")    return SubmissionStatus::Pending;
  if (s == "processing") return SubmissionStatus::Processing;
  if (s == "completed")  return SubmissionStatus::Completed;
  if (s == "failed")     return SubmissionStatus::Failed;
  return std::nullopt;
}

bool is_terminal(SubmissionStatus s) {
  return s == SubmissionStatus::Completed || s == SubmissionStatus::Failed;
}

bool can_transition(SubmissionStatus from, SubmissionStatus to) {
  switch (from) {
    case SubmissionStatus::Pending:
      return to == SubmissionStatus::Processing || to == SubmissionStatus::Failed;
    case SubmissionStatus::Processing:
      return is_terminal(to);
    case SubmissionStatus::Completed:
    case SubmissionStatus::Failed:
      return false;
  }
  return false;
}

int64_t unix_now() {
  return static_cast<int64_t>(std::time(nullptr));
}

} // namespace sai
