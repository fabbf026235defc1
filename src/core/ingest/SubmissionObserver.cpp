#include "SubmissionObserver.hpp"

namespace sai {

void PinningObserver::onSubmissionFinished(const Submission& s) {
  if (s.status != SubmissionStatus::Completed || s.cid.empty()) return;
  store_.pin(s.cid);
}

} // namespace sai
