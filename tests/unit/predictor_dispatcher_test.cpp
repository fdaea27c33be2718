#include "internal/predictor/predictor_dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/ensemble/diversity_controller.hpp"
#include "internal/scheduler/device_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace rnaflow::predictor;
using rnaflow::pipeline::v1::EnsembleResult;
using rnaflow::testing::FakeBackend;

PredictionInput Input() {
  PredictionInput input;
  input.sequence_id = "query";
  input.sequence    = "GGGAAACCC";
  return input;
}

DispatchOptions Options(const std::string& name, std::vector<std::string> devices = {}) {
  DispatchOptions options;
  options.devices    = std::move(devices);
  options.output_dir = rnaflow::testing::TempDir("dispatcher_" + name);
  options.log_dir    = options.output_dir / "logs";
  return options;
}

// Produces no structure even though the process "succeeded".
class SilentBackend : public FakeBackend {
 public:
  SilentBackend() : FakeBackend("silent") {
  }

  MemberOutcome Predict(const PredictionInput&, const MemberRequest& member, const InvocationContext& context) const override {
    MemberOutcome outcome;
    outcome.seed_index        = member.seed_index;
    outcome.structure_path    = context.output_dir / "nothing.pdb";
    outcome.process.exit_code = 0;
    return outcome;
  }
};

class ThrowingBackend : public FakeBackend {
 public:
  ThrowingBackend() : FakeBackend("throwing", {}, true) {
  }

  MemberOutcome Predict(const PredictionInput&, const MemberRequest&, const InvocationContext&) const override {
    throw std::runtime_error("cannot stage input");
  }

  std::vector<MemberOutcome> PredictBatch(const PredictionInput&, const std::vector<MemberRequest>&,
                                          const InvocationContext&) const override {
    throw std::runtime_error("batch launcher crashed");
  }
};

void TestAllMembersSucceedAcrossDevices() {
  FakeBackend backend("rhofold");
  auto        result =
      PredictorDispatcher(Options("devices", {"cuda:0", "cuda:1"})).Run(backend, Input(), rnaflow::ensemble::Plan(5, true, 0.1));

  assert(result.backend() == "rhofold");
  assert(result.members_size() == 5);
  for (int i = 0; i < 5; ++i) {
    const auto& member = result.members(i);
    assert(member.seed_index() == i);
    assert(member.seed() == 100 + i);
    assert(!member.failed());
    assert(std::filesystem::file_size(member.structure_path()) > 0);
    assert(member.device() == (i % 2 == 0 ? "cuda:0" : "cuda:1"));
  }
  assert(result.members(0).noise_scale() == 0.0);
  assert(result.members(3).dropout());
  assert(backend.predict_calls == 5);
  assert(backend.batch_calls == 0);
}

void TestFailedMembersCarryMarkers() {
  FakeBackend backend("simrna", {1, 3});
  auto        result = PredictorDispatcher(Options("failures")).Run(backend, Input(), rnaflow::ensemble::Plan(4, false, 0.0));

  assert(!result.members(0).failed());
  assert(result.members(1).failed());
  assert(result.members(1).failure().find("exit code 1") != std::string::npos);
  assert(result.members(1).failure().find("fake failure for seed 1") != std::string::npos);
  assert(result.members(1).structure_path().empty());
  assert(!result.members(2).failed());
  assert(result.members(3).failed());
  assert(result.members(0).device() == rnaflow::scheduler::kDefaultDevice);
}

void TestExitZeroWithoutStructureIsFailure() {
  SilentBackend backend;
  auto          result = PredictorDispatcher(Options("silent")).Run(backend, Input(), rnaflow::ensemble::Plan(2, false, 0.0));
  for (const auto& member : result.members()) {
    assert(member.failed());
    assert(member.failure().find("produced no structure") != std::string::npos);
  }
}

void TestAdapterExceptionsBecomeMemberFailures() {
  ThrowingBackend backend;

  auto options       = Options("throwing_single");
  options.batch_mode = BatchMode::kPerMember;
  auto single        = PredictorDispatcher(options).Run(backend, Input(), rnaflow::ensemble::Plan(2, false, 0.0));
  assert(single.members(0).failed());
  assert(single.members(0).failure() == "cannot stage input");

  auto batch = PredictorDispatcher(Options("throwing_batch")).Run(backend, Input(), rnaflow::ensemble::Plan(3, false, 0.0));
  for (const auto& member : batch.members()) {
    assert(member.failed());
    assert(member.failure().find("batch launcher crashed") != std::string::npos);
  }
}

void TestBatchModeSelection() {
  FakeBackend batching("protenix", {}, true);
  FakeBackend single("simrna");

  assert(PredictorDispatcher::UseBatch(batching, BatchMode::kAuto));
  assert(!PredictorDispatcher::UseBatch(batching, BatchMode::kPerMember));
  assert(!PredictorDispatcher::UseBatch(single, BatchMode::kAuto));

  bool threw = false;
  try {
    (void)PredictorDispatcher::UseBatch(single, BatchMode::kBatch);
  } catch (const rnaflow::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  // One batch invocation per device group.
  auto result = PredictorDispatcher(Options("batch", {"cuda:0", "cuda:1"})).Run(batching, Input(), rnaflow::ensemble::Plan(4, false, 0.0));
  assert(batching.batch_calls == 2);
  assert(batching.predict_calls == 0);
  for (const auto& member : result.members()) {
    assert(!member.failed());
  }

  assert(ParseBatchMode("") == BatchMode::kAuto);
  assert(ParseBatchMode("per_member") == BatchMode::kPerMember);
  assert(std::string(BatchModeName(BatchMode::kBatch)) == "batch");
  threw = false;
  try {
    (void)ParseBatchMode("sometimes");
  } catch (const rnaflow::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestCancelledDispatchMarksMembersInterrupted() {
  std::atomic<bool> cancel{true};
  FakeBackend       backend("rhofold");
  auto              options = Options("cancelled");
  options.cancel            = &cancel;

  auto result = PredictorDispatcher(options).Run(backend, Input(), rnaflow::ensemble::Plan(3, false, 0.0));
  for (const auto& member : result.members()) {
    assert(member.failed());
    assert(member.failure() == "interrupted");
  }
  assert(backend.predict_calls == 0);
}

} // namespace

int main() {
  TestAllMembersSucceedAcrossDevices();
  TestFailedMembersCarryMarkers();
  TestExitZeroWithoutStructureIsFailure();
  TestAdapterExceptionsBecomeMemberFailures();
  TestBatchModeSelection();
  TestCancelledDispatchMarksMembersInterrupted();

  std::cout << "rnaflow_unit_predictor_dispatcher: pass\n";
  return 0;
}
