#include "predictor_dispatcher.hpp"

#include <algorithm>
#include <map>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/scheduler/device_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace rnaflow::predictor {

using rnaflow::observability::BoolField;
using rnaflow::observability::DoubleField;
using rnaflow::observability::IntField;
using rnaflow::observability::StringField;
using rnaflow::pipeline::v1::EnsembleMember;
using rnaflow::pipeline::v1::EnsembleResult;

namespace {

constexpr const char* kInterrupted = "interrupted";

MemberRequest ToRequest(const EnsembleMember& member) {
  MemberRequest request;
  request.seed_index  = member.seed_index();
  request.seed        = member.seed();
  request.dropout     = member.dropout();
  request.noise_scale = member.noise_scale();
  return request;
}

bool StructurePresent(const std::filesystem::path& path) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
    return false;
  }
  auto size = std::filesystem::file_size(path, ec);
  return !ec && size > 0;
}

void MarkFailed(EnsembleMember& member, const std::string& failure) {
  member.set_failed(true);
  member.set_failure(failure);
  member.clear_structure_path();
  RNAFLOW_LOG_WARN("Ensemble member failed", {StringField("backend", member.backend()), IntField("seed_index", member.seed_index()),
                                              StringField("device", member.device()), StringField("failure", failure)});
}

void Finalize(EnsembleMember& member, const MemberOutcome& outcome) {
  member.set_runtime_seconds(outcome.process.runtime_seconds);
  if (!outcome.error.empty()) {
    MarkFailed(member, outcome.error);
    return;
  }
  if (!outcome.process.Succeeded()) {
    MarkFailed(member, outcome.process.cancelled ? std::string(kInterrupted) : outcome.process.Describe());
    return;
  }
  if (!StructurePresent(outcome.structure_path)) {
    std::string failure = "exited 0 but produced no structure at " + outcome.structure_path.string();
    if (!outcome.process.output_tail.empty()) {
      failure += ": " + outcome.process.output_tail;
    }
    MarkFailed(member, failure);
    return;
  }
  member.set_failed(false);
  member.clear_failure();
  member.set_structure_path(outcome.structure_path.string());
}

} // namespace

BatchMode ParseBatchMode(const std::string& value) {
  if (value.empty() || value == "auto") return BatchMode::kAuto;
  if (value == "batch") return BatchMode::kBatch;
  if (value == "per_member") return BatchMode::kPerMember;
  throw util::ConfigurationError("invalid batch_mode '" + value + "' (expected auto, batch or per_member)");
}

const char* BatchModeName(BatchMode mode) {
  switch (mode) {
    case BatchMode::kAuto:
      return "auto";
    case BatchMode::kBatch:
      return "batch";
    case BatchMode::kPerMember:
      return "per_member";
  }
  return "auto";
}

PredictorDispatcher::PredictorDispatcher(DispatchOptions options) : options_(std::move(options)) {
}

bool PredictorDispatcher::UseBatch(const PredictorBackend& backend, BatchMode mode) {
  switch (mode) {
    case BatchMode::kAuto:
      return backend.SupportsBatch();
    case BatchMode::kBatch:
      if (!backend.SupportsBatch()) {
        throw util::ConfigurationError("backend " + backend.Name() + " cannot run in batch mode");
      }
      return true;
    case BatchMode::kPerMember:
      return false;
  }
  return false;
}

bool PredictorDispatcher::Cancelled() const {
  return options_.cancel && options_.cancel->load();
}

EnsembleResult PredictorDispatcher::Run(const PredictorBackend& backend, const PredictionInput& input,
                                        std::vector<EnsembleMember> members) const {
  const bool batch = UseBatch(backend, options_.batch_mode);
  std::sort(members.begin(), members.end(),
            [](const EnsembleMember& a, const EnsembleMember& b) { return a.seed_index() < b.seed_index(); });

  // Device groups in first-assignment order.
  std::vector<std::string>                          device_order;
  std::map<std::string, std::vector<EnsembleMember>> groups;
  for (std::size_t i = 0; i < members.size(); ++i) {
    auto& member = members[i];
    member.set_backend(backend.Name());
    member.set_seed(backend.SeedFor(member.seed_index()));
    member.set_device(scheduler::DeviceFor(i, options_.devices));
    if (groups.find(member.device()) == groups.end()) {
      device_order.push_back(member.device());
    }
    groups[member.device()].push_back(std::move(member));
  }

  RNAFLOW_LOG_INFO("Dispatching ensemble", {StringField("backend", backend.Name()), IntField("members", static_cast<std::int64_t>(members.size())),
                                            IntField("devices", static_cast<std::int64_t>(device_order.size())),
                                            BoolField("batch", batch)});

  std::vector<std::jthread> workers;
  workers.reserve(device_order.size());
  for (const auto& device : device_order) {
    auto& group = groups[device];
    workers.emplace_back([this, &backend, &input, batch, device, &group] { RunDevice(backend, input, device, batch, group); });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EnsembleResult result;
  result.set_backend(backend.Name());
  for (auto& device : device_order) {
    for (auto& member : groups[device]) {
      *result.add_members() = std::move(member);
    }
  }
  std::sort(result.mutable_members()->begin(), result.mutable_members()->end(),
            [](const EnsembleMember& a, const EnsembleMember& b) { return a.seed_index() < b.seed_index(); });

  int succeeded = 0;
  for (const auto& member : result.members()) {
    if (!member.failed()) ++succeeded;
  }
  RNAFLOW_LOG_INFO("Ensemble finished", {StringField("backend", backend.Name()), IntField("succeeded", succeeded),
                                         IntField("failed", result.members_size() - succeeded)});
  return result;
}

void PredictorDispatcher::RunDevice(const PredictorBackend& backend, const PredictionInput& input, const std::string& device,
                                    bool batch, std::vector<EnsembleMember>& members) const {
  InvocationContext context;
  context.device     = device;
  context.output_dir = options_.output_dir;
  context.log_dir    = options_.log_dir;
  context.timeout    = options_.timeout;
  context.kill_grace = options_.kill_grace;
  context.cancel     = options_.cancel;

  if (batch) {
    if (Cancelled()) {
      for (auto& member : members) MarkFailed(member, kInterrupted);
      return;
    }

    std::vector<MemberRequest> requests;
    for (const auto& member : members) {
      requests.push_back(ToRequest(member));
    }

    std::vector<MemberOutcome> outcomes;
    try {
      outcomes = backend.PredictBatch(input, requests, context);
    } catch (const std::exception& e) {
      for (auto& member : members) MarkFailed(member, std::string("batch invocation failed: ") + e.what());
      return;
    }

    std::map<int, const MemberOutcome*> by_seed;
    for (const auto& outcome : outcomes) {
      by_seed[outcome.seed_index] = &outcome;
    }
    for (auto& member : members) {
      auto it = by_seed.find(member.seed_index());
      if (it == by_seed.end()) {
        MarkFailed(member, "batch invocation reported no output for this seed");
        continue;
      }
      Finalize(member, *it->second);
    }
    return;
  }

  for (auto& member : members) {
    if (Cancelled()) {
      MarkFailed(member, kInterrupted);
      continue;
    }
    RNAFLOW_LOG_DEBUG("Running member", {StringField("backend", backend.Name()), IntField("seed_index", member.seed_index()),
                                         StringField("device", device), DoubleField("noise_scale", member.noise_scale())});
    try {
      Finalize(member, backend.Predict(input, ToRequest(member), context));
    } catch (const std::exception& e) {
      MarkFailed(member, e.what());
    }
  }
}

} // namespace rnaflow::predictor
