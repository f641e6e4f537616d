#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "sextant/audit.hpp"
#include "sextant/config.hpp"
#include "sextant/endpoint.hpp"
#include "sextant/env_config.hpp"
#include "sextant/env_definitions.hpp"
#include "sextant/errors.hpp"
#include "sextant/log.hpp"
#include "sextant/memory_transport.hpp"
#include "sextant/orchestrator.hpp"
#include "sextant/repositories.hpp"
#include "sextant/secrets.hpp"
#include "sextant/stages.hpp"
#include "sextant/transport.hpp"
#include "sextant/worker_context.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return buf.str();
}

void write_text(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << text;
}

bool wait_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(20ms);
  }
  return done();
}

std::mutex g_log_mu;
std::vector<sextant::LogRecord> g_log_records;

void capture_log(const sextant::LogRecord& record) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_records.push_back(record);
}

sextant::TransportConfig testing_transport() {
  sextant::TransportConfig config;
  config.sender_type = "testing";
  config.receiver_type = "testing";
  return config;
}

sextant::SenderTable stage_senders(const std::shared_ptr<sextant::InMemoryBroker>& broker) {
  const auto registry = sextant::builtin_transport_registry(broker);
  sextant::SenderTable table;
  for (sextant::Stage s : sextant::kStageOrder) {
    const auto ep = sextant::endpoint_for(s);
    table[ep] = registry.create_sender(ep, testing_transport());
  }
  return table;
}

// Orchestrator plus one worker endpoint per stage, all on one in-memory
// broker. Hierarchy 1/2/3 (organization/product/repository).
struct Pipeline {
  fs::path root;
  std::shared_ptr<sextant::InMemoryBroker> broker;
  sextant::InMemoryStore store;
  sextant::InMemorySecretsProvider secrets;
  sextant::MemoryConfigFileProvider files;
  sextant::StoreServiceRepository services;
  sextant::EnvironmentDefinitionFactory definitions;
  sextant::EnvironmentConfigLoader loader;
  sextant::ReporterRegistry reporters;
  sextant::RunAuditLog audit;
  sextant::WorkerContextFactory contexts;
  sextant::InMemorySender results;
  sextant::Orchestrator orchestrator;
  std::map<sextant::Stage, std::unique_ptr<sextant::WorkerEndpoint>> endpoints;

  explicit Pipeline(const std::string& name, sextant::OrchestratorOptions options = {})
      : root(fresh_dir(name)),
        broker(std::make_shared<sextant::InMemoryBroker>()),
        services(store),
        definitions(sextant::EnvironmentDefinitionFactory::builtin()),
        loader(store, services, definitions),
        reporters(sextant::ReporterRegistry::builtin()),
        audit((root / "audit.ndjson").string()),
        contexts(store, store, secrets, files, root / "tmp"),
        results(broker, sextant::Endpoint::orchestrator),
        orchestrator(store, stage_senders(broker), audit, options) {
    store.add_hierarchy(sextant::Hierarchy{1, 2, 3});
    files.put("main", "reporter/template.txt", "Run ${runId}: ${issueCount}");
    const auto handlers = sextant::builtin_stage_handlers(
        sextant::StageServices{files, loader, reporters, root / "reports"});
    for (sextant::Stage s : sextant::kStageOrder) set_handler(s, *handlers.find(s));
  }
  ~Pipeline() { fs::remove_all(root); }

  void set_handler(sextant::Stage stage, sextant::StageHandler handler) {
    endpoints[stage] = std::make_unique<sextant::WorkerEndpoint>(stage, contexts, std::move(handler), results);
  }

  void add_run(sextant::Id id, std::initializer_list<sextant::Stage> stages) {
    sextant::Run run;
    run.id = id;
    run.repository_id = 3;
    run.revision = "main";
    run.created_ms = sextant::now_unix_ms();
    for (sextant::Stage s : stages) run.job_configs.stages[s] = {};
    store.store_run(run);
  }

  sextant::Run run(sextant::Id id) const { return *store.get_run(id); }

  void send(sextant::Payload payload, const sextant::MessageHeader& header = {"tok", ""}) {
    results.send(sextant::Message{header, std::move(payload)});
  }

  // One message through the given worker endpoint.
  bool deliver(sextant::Stage stage) {
    sextant::InMemoryReceiver receiver(broker, sextant::endpoint_for(stage));
    return endpoints.at(stage)->run_once(receiver, 50ms);
  }

  // One message through the orchestrator.
  bool settle() {
    sextant::InMemoryReceiver receiver(broker, sextant::Endpoint::orchestrator);
    return orchestrator.run_once(receiver, 50ms);
  }

  // Delivers until every queue is empty.
  void pump() {
    bool progressed = true;
    while (progressed) {
      progressed = false;
      while (settle()) progressed = true;
      for (sextant::Stage s : sextant::kStageOrder) {
        while (deliver(s)) progressed = true;
      }
    }
  }
};

// ============================================================================
// Worker endpoint contract
// ============================================================================

void test_scanner_result_echoes_header() {
  Pipeline p("sextant_e2e_echo");
  p.add_run(4, {sextant::Stage::scanner});
  auto run = p.run(4);
  run.status = sextant::RunStatus::active;
  run.jobs[sextant::Stage::scanner] =
      sextant::Job{17, sextant::Stage::scanner, sextant::JobStatus::scheduled, sextant::now_unix_ms(), 0};
  p.store.store_run(run);

  const sextant::MessageHeader header{"tok-1", "trace-abc"};
  p.broker->publish(sextant::Endpoint::scanner,
                    sextant::encode(sextant::Message{header, sextant::JobRequest{sextant::Stage::scanner, 4, 17}}));
  expect(p.deliver(sextant::Stage::scanner), "scanner request consumed");

  const auto sent = p.broker->drain(sextant::Endpoint::orchestrator);
  expect(sent.size() == 1, "exactly one message sent to the orchestrator");
  expect(sent[0].header == header, "token and trace id echoed unchanged");
  const auto* result = std::get_if<sextant::JobResult>(&sent[0].payload);
  expect(result && result->stage == sextant::Stage::scanner, "ScannerResult sent");
  expect(result->run_id == 4 && result->job_id == 17, "result carries run and job id");
  expect(sextant::payload_type(sent[0].payload) == "ScannerResult", "result type name");
  expect(!fs::exists(p.root / "tmp") || fs::is_empty(p.root / "tmp"), "context temp dirs removed");
}

void test_run_not_found_error() {
  Pipeline p("sextant_e2e_missing");
  p.broker->publish(sextant::Endpoint::scanner,
                    sextant::encode(sextant::Message{{"t", "x"}, sextant::JobRequest{sextant::Stage::scanner, 99, 1}}));
  expect(p.deliver(sextant::Stage::scanner), "request consumed");

  const auto sent = p.broker->drain(sextant::Endpoint::orchestrator);
  expect(sent.size() == 1, "error reported");
  const auto* error = std::get_if<sextant::JobError>(&sent[0].payload);
  expect(error && error->message == "Could not resolve run with ID 99.", "run-not-found message");
  expect(sextant::payload_type(sent[0].payload) == "ScannerError", "error type name");

  p.send(sent[0].payload);
  expect(p.settle(), "orchestrator consumes error for unknown run");
  expect(p.endpoints.at(sextant::Stage::scanner)->stats().jobs_failed.load() == 1, "endpoint counted failure");
}

void test_wrong_stage_ignored() {
  Pipeline p("sextant_e2e_wrong_stage");
  p.add_run(1, {sextant::Stage::scanner});
  p.broker->publish(sextant::Endpoint::scanner,
                    sextant::encode(sextant::Message{{}, sextant::JobRequest{sextant::Stage::advisor, 1, 1}}));
  expect(p.deliver(sextant::Stage::scanner), "message consumed");
  expect(p.broker->pending(sextant::Endpoint::orchestrator) == 0, "nothing sent for a foreign request");
  expect(p.endpoints.at(sextant::Stage::scanner)->stats().messages_ignored.load() == 1, "counted as ignored");
}

// ============================================================================
// Orchestration
// ============================================================================

void test_strict_environment_fails_run() {
  Pipeline p("sextant_e2e_strict");
  p.add_run(1, {sextant::Stage::analyzer, sextant::Stage::reporter});
  auto run = p.run(1);
  sextant::EnvironmentConfig config;
  config.infrastructure_services.push_back(sextant::InfrastructureServiceDeclaration{
      "Artifactory", "https://repo.example.org", "", "repoUser", "repoPass"});
  config.environment_definitions["maven"].push_back({{"service", "Artifactory"}, {"id", "releases"}});
  sextant::EnvironmentVariableDeclaration var;
  var.name = "TOKEN";
  var.secret_name = "nonexistent";
  config.environment_variables.push_back(var);
  run.environment_config = config;
  p.store.store_run(run);
  p.store.add_secret(sextant::Secret{0, "", "repoUser", "", sextant::SecretScope::repository, 3});
  p.store.add_secret(sextant::Secret{0, "", "repoPass", "", sextant::SecretScope::organization, 1});

  p.send(sextant::CreateRun{1});
  p.pump();

  const auto done = p.run(1);
  expect(done.status == sextant::RunStatus::failed, "run failed");
  expect(done.jobs.at(sextant::Stage::analyzer).status == sextant::JobStatus::failed, "analyzer job failed");
  expect(!done.jobs.contains(sextant::Stage::reporter), "reporter never scheduled");
  expect(p.broker->published_count(sextant::Endpoint::reporter) == 0, "no reporter request sent");
  expect(!done.issues.empty(), "failure recorded as issue");
  const auto& issue = done.issues.back();
  expect(issue.source == "analyzer" && issue.severity == sextant::Severity::error, "error issue from analyzer");
  expect(issue.message == "Invalid secret names. The following names cannot be resolved: [nonexistent]",
         "issue carries the unresolved names");
}

void test_out_of_order_result_discarded() {
  Pipeline p("sextant_e2e_order");
  p.add_run(1, {sextant::Stage::analyzer, sextant::Stage::reporter});

  p.send(sextant::CreateRun{1}, {"tok", "trace-order"});
  expect(p.settle(), "create handled");
  expect(p.run(1).status == sextant::RunStatus::active, "run active");
  expect(p.broker->pending(sextant::Endpoint::analyzer) == 1, "analyzer dispatched");

  // A reporter result arrives before the analyzer has finished.
  p.send(sextant::JobResult{sextant::Stage::reporter, 1, 999, {}, std::nullopt, std::nullopt});
  expect(p.settle(), "early result handled");
  expect(p.orchestrator.stats().results_discarded.load() == 1, "early result discarded");
  expect(p.broker->pending(sextant::Endpoint::reporter) == 0, "no reporter request before the analyzer result");
  expect(p.run(1).status == sextant::RunStatus::active, "run still active");

  expect(p.deliver(sextant::Stage::analyzer), "analyzer ran");
  expect(p.settle(), "analyzer result handled");
  expect(p.broker->pending(sextant::Endpoint::reporter) == 1, "reporter dispatched after the analyzer result");
  expect(p.run(1).status == sextant::RunStatus::active, "run not finished after the analyzer alone");

  expect(p.deliver(sextant::Stage::reporter), "reporter ran");
  expect(p.settle(), "reporter result handled");
  const auto done = p.run(1);
  expect(done.status == sextant::RunStatus::finished, "run finished after both stages");
  expect(done.jobs.at(sextant::Stage::analyzer).status == sextant::JobStatus::finished &&
             done.jobs.at(sextant::Stage::reporter).status == sextant::JobStatus::finished,
         "both jobs finished");
  expect(done.trace_id == "trace-order", "trace id taken from the create request");
  expect(fs::exists(p.root / "reports" / "1" / "report.json"), "report written");
}

void test_full_pipeline() {
  Pipeline p("sextant_e2e_full");
  p.files.put("v2", "reporter/template.txt", "v2 ${runId}");
  p.files.alias("release", "v2");
  p.add_run(2, {sextant::Stage::config, sextant::Stage::analyzer, sextant::Stage::advisor, sextant::Stage::scanner,
                sextant::Stage::evaluator, sextant::Stage::reporter, sextant::Stage::notifier});
  auto run = p.run(2);
  run.job_config_context = "release";
  auto& reporter = run.job_configs.stages[sextant::Stage::reporter];
  reporter.options["formats"] = "text";
  reporter.plugin_config["text"].options["template"] = "@ORT_CONFIG/reporter/template.txt";
  p.store.store_run(run);

  p.send(sextant::CreateRun{2});
  p.pump();

  const auto done = p.run(2);
  expect(done.status == sextant::RunStatus::finished, "all stages succeeded");
  expect(done.jobs.size() == 7, "one job per stage");
  std::set<sextant::Id> ids;
  for (const auto& [stage, job] : done.jobs) {
    expect(job.status == sextant::JobStatus::finished, "job finished: " + sextant::to_string(stage));
    ids.insert(job.id);
  }
  expect(ids.size() == 7, "job ids unique");
  expect(done.resolved_job_config_context == std::optional<std::string>("v2"), "config stage resolved context");
  expect(done.resolved_job_configs.has_value(), "resolved job configs recorded");
  expect(!done.trace_id.empty(), "trace id generated");

  std::ifstream report(p.root / "reports" / "2" / "report.txt");
  std::string text;
  std::getline(report, text);
  expect(text == "v2 2", "reporter used the resolved configuration context");
  expect(p.orchestrator.stats().jobs_dispatched.load() == 7, "seven jobs dispatched");
  expect(p.orchestrator.tracked_runs() == 0, "run lock released after the last message");

  const auto chain = sextant::verify_audit_chain(p.audit.path());
  expect(chain.ok && chain.entries == p.audit.entry_count(), "audit chain intact");
}

void test_stage_failure_fails_run() {
  Pipeline p("sextant_e2e_failure");
  p.set_handler(sextant::Stage::scanner, [](sextant::WorkerContext&, const sextant::JobRequest&) -> sextant::JobResult {
    throw std::runtime_error("scanner crashed");
  });
  p.add_run(3, {sextant::Stage::scanner, sextant::Stage::reporter});
  p.send(sextant::CreateRun{3});
  p.pump();

  const auto done = p.run(3);
  expect(done.status == sextant::RunStatus::failed, "run failed");
  expect(done.jobs.at(sextant::Stage::scanner).status == sextant::JobStatus::failed, "scanner job failed");
  expect(p.broker->published_count(sextant::Endpoint::reporter) == 0, "later stage never dispatched");
  expect(done.issues.back().message == "scanner crashed" && done.issues.back().source == "scanner",
         "error message recorded");
  expect(p.orchestrator.stats().runs_failed.load() == 1, "failure counted");
}

void test_issue_threshold() {
  const auto warn_handler = [](sextant::WorkerContext&, const sextant::JobRequest&) {
    sextant::JobResult r;
    r.issues.push_back(sextant::Issue{sextant::now_unix_ms(), "advisor", "vulnerable dependency",
                                      sextant::Severity::warning});
    return r;
  };

  Pipeline p("sextant_e2e_threshold");
  p.set_handler(sextant::Stage::advisor, warn_handler);
  p.add_run(1, {sextant::Stage::advisor});
  p.send(sextant::CreateRun{1});
  p.pump();
  expect(p.run(1).status == sextant::RunStatus::finished_with_issues, "warning reaches default threshold");

  sextant::OrchestratorOptions lenient;
  lenient.issue_severity_threshold = sextant::Severity::error;
  Pipeline q("sextant_e2e_threshold_error", lenient);
  q.set_handler(sextant::Stage::advisor, warn_handler);
  q.add_run(1, {sextant::Stage::advisor});
  q.send(sextant::CreateRun{1});
  q.pump();
  expect(q.run(1).status == sextant::RunStatus::finished, "warning below error threshold");
}

void test_duplicate_and_late_results() {
  sextant::OrchestratorOptions options;
  options.late_result_log_level = sextant::LogLevel::error;
  Pipeline p("sextant_e2e_duplicates", options);
  p.add_run(1, {sextant::Stage::analyzer, sextant::Stage::reporter});
  p.send(sextant::CreateRun{1});
  expect(p.settle(), "create handled");
  expect(p.deliver(sextant::Stage::analyzer), "analyzer ran");

  // Keep a copy of the analyzer result to replay it.
  const auto analyzer_results = p.broker->drain(sextant::Endpoint::orchestrator);
  expect(analyzer_results.size() == 1, "one analyzer result");
  p.send(analyzer_results[0].payload);
  p.send(analyzer_results[0].payload);

  {
    std::lock_guard<std::mutex> lk(g_log_mu);
    g_log_records.clear();
  }
  sextant::set_log_hook(capture_log);
  p.pump();
  sextant::set_log_hook(nullptr);

  const auto done = p.run(1);
  expect(done.status == sextant::RunStatus::finished, "run finished once");
  expect(p.broker->published_count(sextant::Endpoint::reporter) == 1, "duplicate did not redispatch");
  expect(p.orchestrator.stats().results_discarded.load() == 1, "duplicate discarded");

  p.send(analyzer_results[0].payload);
  expect(p.settle(), "late result handled");
  expect(p.run(1).status == sextant::RunStatus::finished, "late result leaves terminal run untouched");
  expect(p.orchestrator.stats().results_discarded.load() == 2, "late result discarded");

  p.send(sextant::CreateRun{1});
  expect(p.settle(), "second create handled");
  expect(p.orchestrator.stats().results_discarded.load() == 3, "repeated create discarded");
  expect(p.orchestrator.stats().runs_started.load() == 1, "run started once");

  std::lock_guard<std::mutex> lk(g_log_mu);
  bool logged = false;
  for (const auto& r : g_log_records) {
    if (r.message == "discarding late or duplicate message") logged = r.level == sextant::LogLevel::error;
  }
  expect(logged, "discard logged at the configured level");
}

void test_cancel_run() {
  Pipeline p("sextant_e2e_cancel");
  p.add_run(5, {sextant::Stage::analyzer, sextant::Stage::reporter});
  p.send(sextant::CreateRun{5});
  expect(p.settle(), "create handled");

  p.send(sextant::CancelRun{5});
  expect(p.settle(), "cancel handled");
  auto cancelled = p.run(5);
  expect(cancelled.status == sextant::RunStatus::cancelled, "run cancelled");
  expect(cancelled.jobs.at(sextant::Stage::analyzer).status == sextant::JobStatus::cancelled, "job cancelled");

  expect(p.deliver(sextant::Stage::analyzer), "stale request consumed");
  const auto& analyzer_stats = p.endpoints.at(sextant::Stage::analyzer)->stats();
  expect(analyzer_stats.jobs_skipped.load() == 1, "skip counted");
  expect(analyzer_stats.jobs_failed.load() == 0, "skip is not a failure");
  expect(analyzer_stats.messages_ignored.load() == 0, "request was not ignored");

  auto replies = p.broker->drain(sextant::Endpoint::orchestrator);
  expect(replies.size() == 1, "exactly one reply for the skipped request");
  const auto* error = std::get_if<sextant::JobError>(&replies.front().payload);
  expect(error != nullptr, "skip answered with an error");
  expect(error->run_id == 5 && error->stage == sextant::Stage::analyzer, "error addresses the request");
  expect(error->message == "Run 5 is already cancelled.", "error names the run status");
  expect(replies.front().header.token == "tok", "request header echoed");

  p.results.send(replies.front());
  expect(p.settle(), "reply handled");
  expect(p.orchestrator.stats().results_discarded.load() == 1, "reply discarded");
  expect(p.broker->pending(sextant::Endpoint::orchestrator) == 0, "nothing else queued");
  expect(p.run(5).status == sextant::RunStatus::cancelled, "reply leaves the run cancelled");

  p.send(sextant::CancelRun{5});
  expect(p.settle(), "second cancel handled");
  expect(p.orchestrator.stats().runs_cancelled.load() == 1, "cancelled once");
  expect(p.run(5).status == sextant::RunStatus::cancelled, "still cancelled");
  expect(p.orchestrator.tracked_runs() == 0, "no run locks left behind");
}

void test_missing_sender_fails_run() {
  Pipeline p("sextant_e2e_no_sender");
  auto senders = stage_senders(p.broker);
  senders.erase(sextant::Endpoint::reporter);
  sextant::Orchestrator orchestrator(p.store, senders, p.audit);

  p.add_run(6, {sextant::Stage::analyzer, sextant::Stage::reporter});
  orchestrator.handle(sextant::Message{{"tok", ""}, sextant::CreateRun{6}});
  expect(p.deliver(sextant::Stage::analyzer), "analyzer ran");
  sextant::InMemoryReceiver receiver(p.broker, sextant::Endpoint::orchestrator);
  expect(orchestrator.run_once(receiver, 50ms), "analyzer result handled");

  const auto done = p.run(6);
  expect(done.status == sextant::RunStatus::failed, "run failed when a stage cannot be dispatched");
  expect(done.jobs.at(sextant::Stage::reporter).status == sextant::JobStatus::failed, "reporter job failed");
  expect(done.issues.back().message == "No transport configured for endpoint 'reporter'.", "dispatch issue");
}

// A store write that fails leaves the run as it was; the message goes back
// to the queue and its redelivery performs the whole transition.
void test_store_failure_redelivered() {
  const fs::path root = fresh_dir("sextant_e2e_store_failure");
  const fs::path file = root / "store.json";
  write_text(file,
             "{\"hierarchies\":[{\"organizationId\":1,\"productId\":2,\"repositoryId\":3}],"
             "\"runs\":[{\"id\":1,\"repositoryId\":3,\"status\":\"created\","
             "\"jobConfigs\":{\"analyzer\":{\"options\":{}},\"reporter\":{\"options\":{}}}}]}");
  auto store = sextant::InMemoryStore::open_file(file);
  auto broker = std::make_shared<sextant::InMemoryBroker>();
  sextant::RunAuditLog audit((root / "audit.ndjson").string());
  sextant::Orchestrator orchestrator(*store, stage_senders(broker), audit);
  sextant::InMemorySender to_orchestrator(broker, sextant::Endpoint::orchestrator);
  sextant::InMemoryReceiver inbox(broker, sextant::Endpoint::orchestrator);

  // A directory in place of the store file makes every write fail.
  std::string persisted;
  const auto block = [&]() {
    persisted = read_text(file);
    fs::remove(file);
    write_text(file / "held", "");
  };
  const auto unblock = [&]() {
    fs::remove_all(file);
    write_text(file, persisted);
  };
  const auto handling_fails = [&]() {
    try {
      orchestrator.run_once(inbox, 50ms);
    } catch (const sextant::Error&) {
      return true;
    }
    return false;
  };

  to_orchestrator.send(sextant::Message{{"tok", "trace-store"}, sextant::CreateRun{1}});
  block();
  expect(handling_fails(), "create fails while the store cannot be written");
  expect(broker->pending(sextant::Endpoint::orchestrator) == 1, "create returned to the queue");
  expect(broker->pending(sextant::Endpoint::analyzer) == 0, "nothing dispatched");
  expect(orchestrator.tracked_runs() == 0, "run lock released after the failure");
  unblock();
  expect(store->get_run(1)->status == sextant::RunStatus::created, "run still created");

  expect(orchestrator.run_once(inbox, 50ms), "create redelivered");
  expect(store->get_run(1)->status == sextant::RunStatus::active, "run active after redelivery");
  const auto analyzer = broker->expect_message(sextant::Endpoint::analyzer);
  const auto& analyzer_request = std::get<sextant::JobRequest>(analyzer.payload);
  expect(analyzer.header.trace_id == "trace-store", "trace id kept across redelivery");

  to_orchestrator.send(sextant::Message{
      analyzer.header, sextant::JobResult{sextant::Stage::analyzer, 1, analyzer_request.job_id, {}, std::nullopt,
                                          std::nullopt}});
  block();
  expect(handling_fails(), "result fails while the store cannot be written");
  expect(broker->pending(sextant::Endpoint::orchestrator) == 1, "result returned to the queue");
  expect(broker->pending(sextant::Endpoint::reporter) == 0, "next stage not dispatched");
  unblock();
  auto run = *store->get_run(1);
  expect(run.jobs.at(sextant::Stage::analyzer).status == sextant::JobStatus::scheduled, "analyzer job still open");
  expect(!run.jobs.contains(sextant::Stage::reporter), "no reporter job recorded");

  expect(orchestrator.run_once(inbox, 50ms), "result redelivered");
  expect(orchestrator.stats().results_discarded.load() == 0, "redelivered result accepted");
  run = *store->get_run(1);
  expect(run.jobs.at(sextant::Stage::analyzer).status == sextant::JobStatus::finished, "analyzer job finished");
  const auto reporter = broker->expect_message(sextant::Endpoint::reporter);
  const auto& reporter_request = std::get<sextant::JobRequest>(reporter.payload);
  expect(reporter_request.job_id == run.jobs.at(sextant::Stage::reporter).id, "reporter request matches the job");

  to_orchestrator.send(sextant::Message{
      reporter.header, sextant::JobResult{sextant::Stage::reporter, 1, reporter_request.job_id, {}, std::nullopt,
                                          std::nullopt}});
  expect(orchestrator.run_once(inbox, 50ms), "reporter result handled");
  expect(sextant::InMemoryStore::open_file(file)->get_run(1)->status == sextant::RunStatus::finished,
         "finished run persisted");
  expect(orchestrator.stats().runs_started.load() == 1, "run started once");
  expect(orchestrator.tracked_runs() == 0, "no run locks left behind");
  fs::remove_all(root);
}

void test_no_stages_finishes() {
  Pipeline p("sextant_e2e_empty");
  p.add_run(8, {});
  p.send(sextant::CreateRun{8});
  expect(p.settle(), "create handled");
  expect(p.run(8).status == sextant::RunStatus::finished, "empty run finishes immediately");
  expect(p.run(8).jobs.empty(), "no jobs");
}

void test_concurrent_runs() {
  sextant::OrchestratorOptions options;
  options.threads = 4;
  options.poll_interval = 20ms;
  Pipeline p("sextant_e2e_concurrent", options);
  constexpr sextant::Id kRuns = 20;
  for (sextant::Id id = 1; id <= kRuns; ++id) p.add_run(id, {sextant::Stage::analyzer, sextant::Stage::reporter});

  std::thread orchestrator([&]() {
    p.orchestrator.serve([&p]() -> std::unique_ptr<sextant::MessageReceiver> {
      return std::make_unique<sextant::InMemoryReceiver>(p.broker, sextant::Endpoint::orchestrator);
    });
  });
  std::vector<std::thread> workers;
  for (sextant::Stage s : {sextant::Stage::analyzer, sextant::Stage::reporter}) {
    for (int i = 0; i < 2; ++i) {
      workers.emplace_back([&p, s]() {
        sextant::InMemoryReceiver receiver(p.broker, sextant::endpoint_for(s));
        p.endpoints.at(s)->serve(receiver, 20ms);
      });
    }
  }

  for (sextant::Id id = 1; id <= kRuns; ++id) p.send(sextant::CreateRun{id});
  const bool all_done = wait_until(
      [&]() {
        for (sextant::Id id = 1; id <= kRuns; ++id) {
          if (!sextant::is_terminal(p.run(id).status)) return false;
        }
        return true;
      },
      15s);

  p.orchestrator.stop();
  p.endpoints.at(sextant::Stage::analyzer)->stop();
  p.endpoints.at(sextant::Stage::reporter)->stop();
  orchestrator.join();
  for (auto& t : workers) t.join();

  expect(all_done, "all runs reached a terminal status");
  for (sextant::Id id = 1; id <= kRuns; ++id) {
    expect(p.run(id).status == sextant::RunStatus::finished, "run finished: " + std::to_string(id));
  }
  expect(p.orchestrator.stats().runs_started.load() == kRuns, "every run started once");
  expect(p.orchestrator.stats().jobs_dispatched.load() == 2 * kRuns, "two jobs per run");
  expect(p.orchestrator.stats().results_discarded.load() == 0, "nothing discarded");
  expect(p.orchestrator.tracked_runs() == 0, "run locks released once runs are idle");
  expect(sextant::verify_audit_chain(p.audit.path()).ok, "audit chain intact under concurrency");
}

// ============================================================================
// Spool transport end to end
// ============================================================================

void test_spool_pipeline() {
  const fs::path root = fresh_dir("sextant_e2e_spool");
  const fs::path repo = root / "checkout";
  write_text(repo / ".ort.env.yml",
             "infrastructureServices:\n"
             "  - name: Artifactory\n"
             "    url: https://repo.example.org/artifactory\n"
             "    usernameSecret: repoUser\n"
             "    passwordSecret: repoPass\n"
             "environmentDefinitions:\n"
             "  maven:\n"
             "    - service: Artifactory\n"
             "      id: releases\n"
             "environmentVariables:\n"
             "  - name: REPO_USER\n"
             "    secretName: repoUser\n");
  write_text(root / "store.json",
             "{\"hierarchies\":[{\"organizationId\":1,\"productId\":2,\"repositoryId\":3}],"
             "\"secrets\":[{\"name\":\"repoUser\",\"scope\":\"repository\",\"scopeId\":3},"
             "{\"name\":\"repoPass\",\"scope\":\"product\",\"scopeId\":2}],"
             "\"runs\":[{\"id\":1,\"repositoryId\":3,\"status\":\"created\",\"jobConfigs\":{"
             "\"analyzer\":{\"options\":{\"repositoryDir\":\"" + repo.string() + "\"}},"
             "\"reporter\":{\"options\":{\"formats\":\"json\"}}}}]}");
  write_text(root / "secrets.json", "{\"repository_3_repoUser\":\"alice\",\"product_2_repoPass\":\"pw\"}");
  setenv("SEXTANT_TRANSPORT_SERVER_URI", ("file://" + (root / "queues").string()).c_str(), 1);

  // Orchestrator and workers keep separate views of the store file.
  auto orchestrator_store = sextant::InMemoryStore::open_file(root / "store.json");
  auto worker_store = sextant::InMemoryStore::open_file(root / "store.json");
  sextant::FileSecretsProvider secrets((root / "secrets.json").string());
  sextant::LocalConfigFileProvider files(root / "config", "main");
  fs::create_directories(root / "config" / "main");

  const auto registry = sextant::builtin_transport_registry();
  sextant::RunAuditLog audit((root / "audit.ndjson").string());
  sextant::Orchestrator orchestrator(*orchestrator_store, sextant::make_stage_senders(registry), audit);

  const sextant::StoreServiceRepository services(*worker_store);
  const auto definitions = sextant::EnvironmentDefinitionFactory::builtin();
  const sextant::EnvironmentConfigLoader loader(*worker_store, services, definitions);
  const auto reporters = sextant::ReporterRegistry::builtin();
  const auto handlers =
      sextant::builtin_stage_handlers(sextant::StageServices{files, loader, reporters, root / "reports"});
  const sextant::WorkerContextFactory contexts(*worker_store, *worker_store, secrets, files, root / "tmp");

  auto to_orchestrator = registry.create_sender(
      sextant::Endpoint::orchestrator, sextant::transport_config_from_env(sextant::Endpoint::orchestrator));
  auto orchestrator_in = registry.create_receiver(
      sextant::Endpoint::orchestrator, sextant::transport_config_from_env(sextant::Endpoint::orchestrator));
  auto analyzer_in = registry.create_receiver(sextant::Endpoint::analyzer,
                                              sextant::transport_config_from_env(sextant::Endpoint::analyzer));
  auto reporter_in = registry.create_receiver(sextant::Endpoint::reporter,
                                              sextant::transport_config_from_env(sextant::Endpoint::reporter));
  sextant::WorkerEndpoint analyzer(sextant::Stage::analyzer, contexts, *handlers.find(sextant::Stage::analyzer),
                                   *to_orchestrator);
  sextant::WorkerEndpoint reporter(sextant::Stage::reporter, contexts, *handlers.find(sextant::Stage::reporter),
                                   *to_orchestrator);

  to_orchestrator->send(sextant::Message{{"tok", "trace-spool"}, sextant::CreateRun{1}});
  expect(orchestrator.run_once(*orchestrator_in, 1s), "create consumed from spool");
  expect(analyzer.run_once(*analyzer_in, 1s), "analyzer request consumed from spool");
  expect(orchestrator.run_once(*orchestrator_in, 1s), "analyzer result consumed");
  expect(reporter.run_once(*reporter_in, 1s), "reporter request consumed");
  expect(orchestrator.run_once(*orchestrator_in, 1s), "reporter result consumed");
  unsetenv("SEXTANT_TRANSPORT_SERVER_URI");

  auto reloaded = sextant::InMemoryStore::open_file(root / "store.json");
  const auto done = reloaded->get_run(1);
  expect(done && done->status == sextant::RunStatus::finished, "run finished and persisted");
  expect(done->trace_id == "trace-spool", "trace id persisted");
  bool prepared = false;
  for (const auto& i : done->issues) {
    prepared = prepared || i.message == "Prepared environment with 1 infrastructure services, 1 environment "
                                        "definitions and 1 variables.";
  }
  expect(prepared, "analyzer resolved the repository environment configuration");
  expect(fs::exists(root / "reports" / "1" / "report.json"), "report written");
  expect(!fs::exists(root / "tmp") || fs::is_empty(root / "tmp"), "no temp dirs left behind");
  expect(fs::is_empty(root / "queues" / "analyzer" / "new") && fs::is_empty(root / "queues" / "analyzer" / "cur"),
         "analyzer queue drained");
  const auto chain = sextant::verify_audit_chain((root / "audit.ndjson").string());
  expect(chain.ok && chain.entries >= 5, "audit chain covers the run");
  fs::remove_all(root);
}

}  // namespace

int main() {
  sextant::set_log_level(sextant::LogLevel::error);
  std::cout << "=== Sextant End-to-End Test Suite ===\n";

  std::cout << "\n[Worker Endpoints]\n";
  run_test("scanner result echoes header", test_scanner_result_echoes_header);
  run_test("run not found becomes error", test_run_not_found_error);
  run_test("wrong stage ignored", test_wrong_stage_ignored);

  std::cout << "\n[Orchestration]\n";
  run_test("strict environment fails run", test_strict_environment_fails_run);
  run_test("out-of-order result discarded", test_out_of_order_result_discarded);
  run_test("full pipeline (7 stages)", test_full_pipeline);
  run_test("stage failure fails run", test_stage_failure_fails_run);
  run_test("issue severity threshold", test_issue_threshold);
  run_test("duplicate and late results", test_duplicate_and_late_results);
  run_test("cancel run", test_cancel_run);
  run_test("missing sender fails run", test_missing_sender_fails_run);
  run_test("no stages finishes", test_no_stages_finishes);
  run_test("store failure redelivered", test_store_failure_redelivered);
  run_test("concurrent runs (20 runs, 4 threads)", test_concurrent_runs);

  std::cout << "\n[Spool Transport]\n";
  run_test("spool pipeline", test_spool_pipeline);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
