#pragma once
#include <string>

#include "core/content/ContentStore.hpp"
#include "core/model/Types.hpp"

namespace sai {

// Notified synchronously after a submission reached completed or failed
// and was committed. Exceptions are caught and logged by the caller.
class SubmissionObserver {
public:
  virtual ~SubmissionObserver() = default;
  virtual std::string name() const = 0;
  virtual void onSubmissionFinished(const Submission& s) = 0;
};

// Pins the bundle of every completed submission on the local node.
class PinningObserver : public SubmissionObserver {
public:
  explicit PinningObserver(ContentStore& store) : store_(store) {}

  std::string name() const override { return "pin"; }
  void onSubmissionFinished(const Submission& s) override;

private:
  ContentStore& store_;
};

} // namespace sai
