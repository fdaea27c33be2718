#include <sys/stat.h>

#include <cassert>
#include <cmath>
#include <iostream>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/ensemble/diversity_controller.hpp"
#include "internal/predictor/backend_support.hpp"
#include "internal/predictor/predictor_dispatcher.hpp"
#include "internal/predictor/protenix_backend.hpp"
#include "internal/predictor/rhofold_backend.hpp"
#include "internal/predictor/simrna_backend.hpp"
#include "internal/scoring/rnadvisor_scorer.hpp"
#include "internal/upstream/infernal_tool.hpp"
#include "internal/upstream/rnafold_tool.hpp"
#include "support/fakes.hpp"

namespace {

using namespace rnaflow;

std::filesystem::path WriteScript(const std::filesystem::path& path, const std::string& body) {
  testing::WriteFile(path, "#!/bin/sh\n" + body);
  ::chmod(path.c_str(), 0755);
  return path;
}

void TestRfamTableParsing() {
  const std::string tblout =
      "#idx target name          accession query name  accession clan name mdl mdl from   mdl to seq from   seq to strand trunc pass   gc  bias  score   E-value inc olp anyidx afrct1 afrct2 winidx wfrct1 wfrct2 description of target\n"
      "#--- -------------------- --------- ----------- --------- ---------- --- -------- -------- -------- -------- ------ ----- ---- ---- ----- ------ --------- --- --- ------ ------ ------ ------ ------ ------ ---------------------\n"
      "1    tRNA                 RF00005   query       -         CL00001    cm        1       71        1       72      +    no    1 0.58   0.0   74.1   3.2e-15  !   *       -      -      -      -      -      - tRNA\n"
      "2    tmRNA                RF00023   query       -         -          cm        1      350        5       70      +    no    1 0.55   0.0   12.4   2.1e-02  ?   *       -      -      -      -      -      - tmRNA\n";

  auto hit = upstream::InfernalTool::ParseTopHit(tblout);
  assert(hit.has_value());
  assert(hit->family == "tRNA");
  assert(hit->accession == "RF00005");
  assert(std::abs(hit->evalue - 3.2e-15) < 1e-20);

  assert(!upstream::InfernalTool::ParseTopHit("# no hits\n").has_value());
  assert(upstream::FindAlignment({"/r/cmscan.tblout", "/r/alignment.sto"}) == "/r/alignment.sto");
  assert(upstream::FindAlignment({"/r/cmscan.tblout"}).empty());
}

void TestRnafoldParsing() {
  auto fold = upstream::RNAfoldTool::ParseOutput(">query\nGGGAAACCC\n(((...))) ( -1.20)\n(((...))) [ -1.45]\n");
  assert(fold.has_value());
  assert(fold->sequence == "GGGAAACCC");
  assert(fold->dot_bracket == "(((...)))");
  assert(std::abs(fold->mfe + 1.2) < 1e-9);

  assert(!upstream::RNAfoldTool::ParseOutput("GGGAAACCC\n((..\n").has_value());
  assert(!upstream::RNAfoldTool::ParseOutput("").has_value());
}

void TestRnafoldToolWithStubExecutable() {
  auto dir  = testing::TempDir("adapter_rnafold");
  auto stub = WriteScript(dir / "RNAfold", "echo '>query'\necho 'GGGGAAACCCC'\necho '((((...)))) ( -4.30)'\n");
  testing::WriteFile(dir / "query.fasta", ">query\nGGGGAAACCCC\n");

  config::ToolsConfig tools;
  tools.set_rnafold(stub.string());
  upstream::RNAfoldTool tool(tools);
  assert(tool.IsAvailable());

  upstream::UpstreamContext context;
  context.work_dir = dir / "02_secondary_structure";
  context.log_dir  = dir / "logs";
  auto result      = tool.Run(dir / "query.fasta", context);
  assert(result.succeeded);
  assert(result.artifacts.size() == 1);
  assert(result.note == "MFE -4.30 kcal/mol");
  assert(upstream::ReadDotBracket(result.artifacts[0]) == "((((...))))");

  config::ToolsConfig missing;
  missing.set_rnafold((dir / "not-there").string());
  assert(!upstream::RNAfoldTool(missing).IsAvailable());
}

void TestRhoFoldThroughDispatcher() {
  auto dir  = testing::TempDir("adapter_rhofold");
  auto stub = WriteScript(dir / "inference.sh",
                          "out=''; seed=''\n"
                          "while [ $# -gt 0 ]; do\n"
                          "  case \"$1\" in\n"
                          "    --output_dir) out=\"$2\"; shift 2;;\n"
                          "    --seed) seed=\"$2\"; shift 2;;\n"
                          "    *) shift;;\n"
                          "  esac\n"
                          "done\n"
                          "if [ \"$seed\" = \"1\" ]; then echo 'CUDA out of memory' >&2; exit 1; fi\n"
                          "[ \"$PYTHONHASHSEED\" = \"$seed\" ] || exit 4\n"
                          "printf \"ATOM      1  C3'   G A   1       1.000   2.000   3.000  1.00  0.00\\n\" > \"$out/unrelaxed_model.pdb\"\n");
  testing::WriteFile(dir / "query.fasta", ">query\nGGGAAACCC\n");

  config::RhoFoldConfig rhofold;
  rhofold.set_python("/bin/sh");
  rhofold.set_script(stub.string());
  predictor::RhoFoldBackend backend(rhofold);
  assert(backend.IsAvailable());
  assert(!backend.SupportsBatch());

  predictor::PredictionInput input;
  input.fasta    = dir / "query.fasta";
  input.sequence = "GGGAAACCC";

  predictor::DispatchOptions options;
  options.output_dir = dir / "03_prediction" / "rhofold";
  options.log_dir    = dir / "logs";
  auto result        = predictor::PredictorDispatcher(options).Run(backend, input, ensemble::Plan(3, true, 0.05));

  assert(result.members_size() == 3);
  assert(!result.members(0).failed());
  assert(result.members(1).failed());
  assert(result.members(1).failure().find("CUDA out of memory") != std::string::npos);
  assert(!result.members(2).failed());
  assert(result.members(2).structure_path() == (options.output_dir / "seed_2" / "unrelaxed_model.pdb").string());
  assert(std::filesystem::exists(dir / "logs" / "rhofold_seed1.stderr.log"));
}

void TestBackendHelpers() {
  assert(predictor::SanitizeLabel("cuda:1") == "cuda_1");
  assert(predictor::GpuIndex("cuda:2") == "2");
  assert(predictor::GpuIndex("3") == "3");
  assert(predictor::GpuIndex("default").empty());
  assert(predictor::JoinSeeds({42, 43, 44}) == "42,43,44");

  auto dir = testing::TempDir("adapter_find_structure");
  testing::WriteFile(dir / "query" / "seed_420" / "predictions" / "model_0.cif", "data_x\n");
  testing::WriteFile(dir / "query" / "seed_42" / "predictions" / "model_0.cif", "data_x\n");
  testing::WriteFile(dir / "query" / "seed_42" / "predictions" / "model_1.cif", "data_x\n");
  auto found = predictor::FindStructure(dir, {".cif", ".pdb"}, "/seed_42/");
  assert(found == dir / "query" / "seed_42" / "predictions" / "model_0.cif");
  assert(predictor::FindStructure(dir, {".pdb"}).empty());
}

void TestSimRnaRestraints() {
  auto restraints = predictor::SimRNABackend::RestraintsFromDotBracket("((..))");
  assert(restraints == "DIST A 2 N1 A 5 N3 5.0 10.0 1.0\nDIST A 1 N1 A 6 N3 5.0 10.0 1.0\n");
  assert(predictor::SimRNABackend::RestraintsFromDotBracket("......").empty());

  config::SimRNAConfig simrna;
  simrna.set_base_seed(7);
  predictor::SimRNABackend backend(simrna);
  assert(backend.SeedFor(0) == 7);
  assert(backend.SeedFor(3) == 10);
  assert(!backend.SupportsBatch());
}

void TestProtenixInputJson() {
  auto json = predictor::ProtenixBackend::BuildInputJson("query", "GGGAAACCC", {42, 43});

  google::protobuf::Value root;
  assert(google::protobuf::util::JsonStringToMessage(json, &root).ok());
  assert(root.list_value().values_size() == 1);
  const auto& job = root.list_value().values(0).struct_value().fields();
  assert(job.at("name").string_value() == "rnaflow_query");
  assert(job.at("modelSeeds").list_value().values_size() == 2);
  assert(job.at("modelSeeds").list_value().values(1).number_value() == 43);
  const auto& chain = job.at("sequences").list_value().values(0).struct_value().fields();
  assert(chain.at("rnaSequence").struct_value().fields().at("sequence").string_value() == "GGGAAACCC");

  config::ProtenixConfig protenix;
  protenix.set_base_seed(42);
  predictor::ProtenixBackend backend(protenix);
  assert(backend.SupportsBatch());
  assert(backend.SeedFor(2) == 44);
}

void TestRnadvisorCsv() {
  auto metrics = scoring::RNAdvisorScorer::ParseCsv("name,rsRNASP,DFIRE,comment\nrhofold_seed0.pdb,-512.5,-1203.0,ok\n");
  assert(metrics.size() == 2);
  assert(metrics[0].first == "rsRNASP");
  assert(metrics[0].second == -512.5);
  assert(metrics[1].first == "DFIRE");

  assert(scoring::RNAdvisorScorer::ParseCsv("").empty());
  assert(scoring::RNAdvisorScorer::ParseCsv("name,rsRNASP\n").empty());
}

} // namespace

int main() {
  TestRfamTableParsing();
  TestRnafoldParsing();
  TestRnafoldToolWithStubExecutable();
  TestRhoFoldThroughDispatcher();
  TestBackendHelpers();
  TestSimRnaRestraints();
  TestProtenixInputJson();
  TestRnadvisorCsv();

  std::cout << "rnaflow_unit_tool_adapters: pass\n";
  return 0;
}
