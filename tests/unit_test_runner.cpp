#include "command_line_parser.hpp"
#include "file_transfer.hpp"
#include "name_sanitizer.hpp"
#include "result_aggregator.hpp"
#include "run_configuration.hpp"
#include "settings_manager.hpp"
#include "task_dispatcher.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;
using flat::test::TestCase;
using flat::test::TestContext;
using flat::test::expect;
using flat::test::read_file;
using flat::test::write_file;

SanitizationRule literal(std::string pattern, std::string replacement) {
  return SanitizationRule{std::move(pattern), std::move(replacement), false};
}

SanitizationRule regex(std::string pattern, std::string replacement) {
  return SanitizationRule{std::move(pattern), std::move(replacement), true};
}

FileTransferTask make_task(const fs::path& source, const fs::path& destination) {
  FileTransferTask task;
  task.source_path = source;
  task.destination_path = destination;
  task.relative_display_path = destination.filename().string();
  return task;
}

// Reports a different digest for every file under the given directory.
class CorruptingWorker : public FileTransferWorker {
public:
  CorruptingWorker(const RunConfiguration& config, fs::path corrupt_below)
    : FileTransferWorker(config), corrupt_below_(std::move(corrupt_below)) {}

protected:
  std::optional<std::string> hash_file(const fs::path& file) const override {
    auto digest = FileTransferWorker::hash_file(file);
    if(digest && file.parent_path() == corrupt_below_) {
      (*digest)[0] = (*digest)[0] == '0' ? '1' : '0';
    }
    return digest;
  }

private:
  fs::path corrupt_below_;
};

// ---- name sanitizer -------------------------------------------------------

bool test_sanitize_without_rules(TestContext& ctx) {
  auto logger = ctx.make_logger("sanitize");
  return expect(sanitize_name("RootDir", {}, logger.get()) == "RootDir", "empty rule list is a no-op");
}

bool test_sanitize_identity_when_nothing_matches(TestContext& ctx) {
  auto logger = ctx.make_logger("sanitize");
  std::vector<SanitizationRule> rules = {literal("zzz", "y"), regex("[0-9]+", "#"), literal("__", "_")};
  return expect(sanitize_name("payload-data", rules, logger.get()) == "payload-data",
                "non-matching rules leave the name unchanged");
}

bool test_sanitize_applies_rules_in_order(TestContext& ctx) {
  auto logger = ctx.make_logger("sanitize");
  std::vector<SanitizationRule> rules = {literal("a", "b"), literal("b", "c")};
  bool ok = expect(sanitize_name("a-b", rules, logger.get()) == "c-c", "second rule sees first rule output");
  std::vector<SanitizationRule> reversed = {literal("b", "c"), literal("a", "b")};
  ok &= expect(sanitize_name("a-b", reversed, logger.get()) == "b-c", "order of rules matters");
  return ok;
}

bool test_sanitize_literal_replaces_all_occurrences(TestContext&) {
  bool ok = expect(replace_all_literal("a b c d", " ", "_") == "a_b_c_d", "every occurrence replaced");
  ok &= expect(replace_all_literal("aaa", "aa", "b") == "ba", "non-overlapping, left to right");
  ok &= expect(replace_all_literal("abc", "", "x") == "abc", "empty pattern untouched");
  return ok;
}

bool test_sanitize_regex_with_group_references(TestContext& ctx) {
  auto logger = ctx.make_logger("sanitize");
  std::vector<SanitizationRule> rules = {regex(R"((\d+)_(\w+))", R"(\2-\1)")};
  bool ok = expect(sanitize_name("01_intro", rules, logger.get()) == "intro-01", "backreference template");
  std::vector<SanitizationRule> padded = {regex(R"(v(\d))", R"(v\g<1>0)")};
  ok &= expect(sanitize_name("v2", padded, logger.get()) == "v20", "\\g<N> followed by a digit");
  std::vector<SanitizationRule> dollar = {regex("price", "$5")};
  ok &= expect(sanitize_name("price", dollar, logger.get()) == "$5", "dollar is literal");
  return ok;
}

bool test_sanitize_skips_empty_pattern(TestContext& ctx) {
  auto logger = ctx.make_logger("sanitize");
  std::vector<SanitizationRule> rules = {literal("", "x"), regex("", "y"), literal("o", "0")};
  return expect(sanitize_name("foo", rules, logger.get()) == "f00", "empty patterns skipped");
}

bool test_sanitize_bad_regex_fails_only_that_rule(TestContext& ctx) {
  auto logger = ctx.make_logger("sanitize");
  std::vector<SanitizationRule> rules = {literal(" ", "_"), regex("([unclosed", "x"), literal("-", "+")};
  bool ok = expect(sanitize_name("a b-c", rules, logger.get()) == "a_b+c", "remaining rules still applied");
  ok &= expect(ctx.logs.contains("Regex error in rule pattern '([unclosed'"), "regex error reported");
  return ok;
}

bool test_template_translation(TestContext&) {
  bool ok = expect(to_ecmascript_template(R"(\1)") == "$01", "\\1");
  ok &= expect(to_ecmascript_template(R"(\12x)") == "$12x", "two digit group");
  ok &= expect(to_ecmascript_template(R"(a\\b)") == R"(a\b)", "escaped backslash");
  ok &= expect(to_ecmascript_template("$") == "$$", "dollar escaped");
  bool threw = false;
  try {
    to_ecmascript_template(R"(\g<name>)");
  } catch(const std::invalid_argument&) {
    threw = true;
  }
  ok &= expect(threw, "named groups rejected");
  return ok;
}

bool test_template_rejects_unusable_group_references(TestContext& ctx) {
  auto rejects = [](const std::string& replacement, std::size_t group_count) {
    try {
      to_ecmascript_template(replacement, group_count);
    } catch(const std::invalid_argument&) {
      return true;
    }
    return false;
  };
  bool ok = expect(rejects(R"(\0)", 2), "\\0 is an octal escape, not a group");
  ok &= expect(rejects(R"(\2)", 1), "group beyond the pattern");
  ok &= expect(rejects(R"(\g<3>)", 2), "\\g<N> beyond the pattern");
  ok &= expect(to_ecmascript_template(R"([\g<0>])", 0) == "[$&]", "\\g<0> is the whole match");

  auto logger = ctx.make_logger("sanitize");
  std::vector<SanitizationRule> rules = {regex("(a)", R"(\2)"), literal("a", "b")};
  ok &= expect(sanitize_name("cat", rules, logger.get()) == "cbt", "failing rule leaves the name for the next one");
  ok &= expect(ctx.logs.contains("invalid group reference 2"), "missing group reported");
  std::vector<SanitizationRule> whole = {regex("[0-9]+", R"(<\g<0>>)")};
  ok &= expect(sanitize_name("disc2", whole, logger.get()) == "disc<2>", "whole match substituted");
  return ok;
}

// ---- rule loading ---------------------------------------------------------

bool test_rules_from_json(TestContext&) {
  auto doc = nlohmann::json::parse(R"([
    {"pattern": " ", "replacement": "_", "is_regex": false},
    {"pattern": "\\s+$", "replacement": "", "isRegex": true},
    {"pattern": "x"}
  ])");
  auto rules = rules_from_json(doc);
  bool ok = expect(rules.size() == 3, "three rules");
  if(!ok) return false;
  ok &= expect(rules[0].pattern == " " && rules[0].replacement == "_" && !rules[0].is_regex, "first rule");
  ok &= expect(rules[1].is_regex && rules[1].pattern == "\\s+$", "isRegex alias");
  ok &= expect(rules[2].replacement.empty() && !rules[2].is_regex, "defaults");
  return ok;
}

bool test_rules_file_errors(TestContext&) {
  flat::test::TempWorkspace ws("rules");
  bool ok = true;
  bool threw = false;
  try {
    load_rules_file(ws.root() / "missing.json");
  } catch(const std::runtime_error&) {
    threw = true;
  }
  ok &= expect(threw, "missing file rejected");

  write_file(ws.root() / "object.json", R"({"pattern": "a"})");
  threw = false;
  try {
    load_rules_file(ws.root() / "object.json");
  } catch(const std::runtime_error&) {
    threw = true;
  }
  ok &= expect(threw, "non-array rejected");

  write_file(ws.root() / "broken.json", "[{");
  threw = false;
  try {
    load_rules_file(ws.root() / "broken.json");
  } catch(const std::runtime_error&) {
    threw = true;
  }
  ok &= expect(threw, "malformed JSON rejected");

  write_file(ws.root() / "good.json", R"([{"pattern": "a", "replacement": "b", "is_regex": false}])");
  ok &= expect(load_rules_file(ws.root() / "good.json").size() == 1, "valid file loads");
  return ok;
}

// ---- hashing --------------------------------------------------------------

bool test_sha256(TestContext&) {
  flat::test::TempWorkspace ws("sha");
  bool ok = expect(sha256_hex("abc") ==
                   "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "known digest");
  std::string big(3 * kHashBufferSize + 17, 'q');
  write_file(ws.root() / "big.bin", big);
  auto digest = compute_file_hash(ws.root() / "big.bin");
  ok &= expect(digest && *digest == sha256_hex(big), "streamed file hash matches");
  ok &= expect(!compute_file_hash(ws.root() / "absent.bin"), "missing file has no hash");
  return ok;
}

// ---- file transfer worker -------------------------------------------------

bool test_copy_with_verification(TestContext& ctx) {
  flat::test::TempWorkspace ws("copy_verify");
  auto src = ws.source() / "data.bin";
  auto dst = ws.root() / "data.bin";
  std::string payload(20000, 'x');
  payload[1234] = 'y';
  write_file(src, payload);

  RunConfiguration config;
  config.verify_hash = true;
  FileTransferWorker worker(config, ctx.make_logger("worker"));
  auto outcome = worker(make_task(src, dst));

  bool ok = expect(outcome.success, "copy succeeded");
  ok &= expect(fs::exists(src), "source kept");
  ok &= expect(compute_file_hash(src) == compute_file_hash(dst), "hashes equal");
  return ok;
}

bool test_copy_preserves_metadata(TestContext& ctx) {
  flat::test::TempWorkspace ws("copy_meta");
  auto src = ws.source() / "old.txt";
  auto dst = ws.root() / "old.txt";
  write_file(src, "old contents");
  auto stamp = fs::last_write_time(src) - std::chrono::hours(48);
  fs::last_write_time(src, stamp);
  fs::permissions(src, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read,
                  fs::perm_options::replace);

  bool ok = true;
  for(bool verify : {false, true}) {
    RunConfiguration config;
    config.verify_hash = verify;
    FileTransferWorker worker(config, ctx.make_logger("worker"));
    auto outcome = worker(make_task(src, dst));
    ok &= expect(outcome.success, "copy succeeded");
    ok &= expect(fs::last_write_time(dst) == stamp, "modification time copied");
    ok &= expect(fs::status(dst).permissions() == fs::status(src).permissions(), "permissions copied");
    ok &= expect(read_file(dst) == "old contents", "contents copied");
  }
  return ok;
}

bool test_move_with_verification(TestContext& ctx) {
  flat::test::TempWorkspace ws("move_verify");
  auto src = ws.source() / "moved.bin";
  auto dst = ws.root() / "moved.bin";
  write_file(src, "move me please");
  auto before = compute_file_hash(src);

  RunConfiguration config;
  config.action = TransferAction::Move;
  config.verify_hash = true;
  FileTransferWorker worker(config, ctx.make_logger("worker"));
  auto outcome = worker(make_task(src, dst));

  bool ok = expect(outcome.success, "move succeeded");
  ok &= expect(!fs::exists(src), "source removed");
  ok &= expect(before && compute_file_hash(dst) == before, "destination hash equals pre-move hash");
  return ok;
}

bool test_move_without_verification(TestContext& ctx) {
  flat::test::TempWorkspace ws("move_plain");
  auto src = ws.source() / "plain.txt";
  auto dst = ws.root() / "plain.txt";
  std::string payload = "moved without a hash check\n";
  write_file(src, payload);

  RunConfiguration config;
  config.action = TransferAction::Move;
  FileTransferWorker worker(config, ctx.make_logger("worker"));
  auto outcome = worker(make_task(src, dst));

  bool ok = expect(outcome.success, "move succeeded");
  ok &= expect(!outcome.error_detail, "no failure detail");
  ok &= expect(!fs::exists(src), "source removed");
  ok &= expect(read_file(dst) == payload, "destination holds the original bytes");
  return ok;
}

bool test_transfer_error_becomes_outcome(TestContext& ctx) {
  flat::test::TempWorkspace ws("transfer_error");
  auto src = ws.source() / "file.txt";
  write_file(src, "content");
  fs::create_directories(ws.root() / "blocked" / "file.txt");

  bool ok = true;
  for(auto action : {TransferAction::Copy, TransferAction::Move}) {
    for(bool verify : {false, true}) {
      RunConfiguration config;
      config.action = action;
      config.verify_hash = verify;
      FileTransferWorker worker(config, ctx.make_logger("worker"));
      auto outcome = worker(make_task(src, ws.root() / "blocked" / "file.txt"));
      ok &= expect(!outcome.success, "transfer onto a directory fails");
      ok &= expect(outcome.error_detail && !outcome.error_detail->empty(), "failure carries a detail");
    }
  }
  ok &= expect(fs::exists(src), "source survives failed transfers");

  RunConfiguration config;
  FileTransferWorker worker(config, ctx.make_logger("worker"));
  auto missing = worker(make_task(ws.source() / "nope.txt", ws.root() / "nope.txt"));
  ok &= expect(!missing.success, "missing source fails");
  return ok;
}

bool test_hash_mismatch_keeps_destination(TestContext& ctx) {
  flat::test::TempWorkspace ws("mismatch");
  fs::create_directories(ws.root() / "out");
  bool ok = true;
  for(auto action : {TransferAction::Copy, TransferAction::Move}) {
    auto src = ws.source() / "evidence.txt";
    auto dst = ws.root() / "out" / "evidence.txt";
    write_file(src, "evidence");
    RunConfiguration config;
    config.action = action;
    config.verify_hash = true;
    CorruptingWorker worker(config, ws.root() / "out");
    auto outcome = worker(make_task(src, dst));
    ok &= expect(!outcome.success, "mismatch reported as failure");
    ok &= expect(outcome.error_detail && outcome.error_detail->find("Hash mismatch") != std::string::npos,
                 "detail names the mismatch");
    ok &= expect(read_file(dst) == "evidence", "destination left in place");
  }
  return ok;
}

// ---- dispatcher and aggregation -------------------------------------------

std::vector<FileTransferTask> numbered_tasks(std::size_t count) {
  std::vector<FileTransferTask> tasks;
  for(std::size_t i = 0; i < count; ++i) {
    FileTransferTask task;
    task.relative_display_path = "file" + std::to_string(i);
    tasks.push_back(task);
  }
  return tasks;
}

bool test_dispatcher_runs_every_task(TestContext&) {
  std::atomic<int> calls{0};
  auto tasks = numbered_tasks(25);
  bool result = run_all(tasks, 4, [&](const FileTransferTask&) {
    ++calls;
    return TransferOutcome::ok();
  });
  bool ok = expect(result, "all succeeded");
  ok &= expect(calls.load() == 25, "every task ran");
  return ok;
}

bool test_dispatcher_failure_waits_for_batch(TestContext& ctx) {
  TaskDispatcher dispatcher(3, ctx.make_logger("dispatcher"));
  std::atomic<int> finished{0};
  auto tasks = numbered_tasks(12);
  ResultAggregator results;
  bool result = dispatcher.run_all(tasks, [&](const FileTransferTask& task) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ++finished;
    if(task.relative_display_path == "file0") return TransferOutcome::failure("boom");
    return TransferOutcome::ok();
  }, results);

  bool ok = expect(!result, "batch reports failure");
  ok &= expect(finished.load() == 12, "no task was cancelled and all finished before return");
  ok &= expect(results.failed() == 1 && results.succeeded() == 11, "aggregated counts");
  auto failures = results.failures();
  ok &= expect(failures.size() == 1 && failures[0].relative_display_path == "file0" &&
               failures[0].error_detail == "boom", "failure detail kept");

  // The pool is reusable for the next directory.
  ok &= expect(dispatcher.run_all(numbered_tasks(3), [](const FileTransferTask&) {
    return TransferOutcome::ok();
  }, results), "second batch succeeds");
  ok &= expect(results.succeeded() == 14, "second batch merged");
  return ok;
}

bool test_dispatcher_bounds_concurrency(TestContext&) {
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  auto tasks = numbered_tasks(16);
  bool result = run_all(tasks, 2, [&](const FileTransferTask&) {
    int now = ++active;
    int seen = peak.load();
    while(now > seen && !peak.compare_exchange_weak(seen, now)) {}
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    --active;
    return TransferOutcome::ok();
  });
  bool ok = expect(result, "batch succeeded");
  ok &= expect(peak.load() <= 2 && peak.load() >= 1, "at most two transfers in flight");
  return ok;
}

bool test_dispatcher_rejects_zero_workers(TestContext&) {
  bool threw = false;
  try {
    TaskDispatcher dispatcher(0);
  } catch(const std::invalid_argument&) {
    threw = true;
  }
  return expect(threw, "zero workers rejected");
}

bool test_dispatcher_converts_worker_exceptions(TestContext& ctx) {
  TaskDispatcher dispatcher(2, ctx.make_logger("dispatcher"));
  ResultAggregator results;
  bool result = dispatcher.run_all(numbered_tasks(4), [](const FileTransferTask& task) -> TransferOutcome {
    if(task.relative_display_path == "file2") throw std::runtime_error("worker exploded");
    return TransferOutcome::ok();
  }, results);
  bool ok = expect(!result, "exception counts as failure");
  ok &= expect(results.failed() == 1 && results.succeeded() == 3, "other tasks unaffected");
  return ok;
}

bool test_dispatcher_converts_non_standard_exceptions(TestContext& ctx) {
  TaskDispatcher dispatcher(2, ctx.make_logger("dispatcher"));
  ResultAggregator results;
  bool result = dispatcher.run_all(numbered_tasks(3), [](const FileTransferTask& task) -> TransferOutcome {
    if(task.relative_display_path == "file1") throw 42;
    return TransferOutcome::ok();
  }, results);
  bool ok = expect(!result, "non-standard exception counts as failure");
  auto failures = results.failures();
  ok &= expect(failures.size() == 1 && failures[0].relative_display_path == "file1" &&
               failures[0].error_detail == "unknown error", "failure recorded with a generic detail");
  ok &= expect(results.succeeded() == 2, "other tasks unaffected");
  return ok;
}

bool test_dispatcher_start_failure_joins_started_threads(TestContext& ctx) {
  bool failed_to_start = false;
  std::size_t started = 0;
  {
    flat::test::AddressSpaceLimit limit(256ull * 1024 * 1024);
    if(!limit.active()) return true;
    try {
      TaskDispatcher dispatcher(1000, ctx.make_logger("dispatcher"));
      started = dispatcher.worker_count();
    } catch(const std::system_error&) {
      failed_to_start = true;
    } catch(const std::bad_alloc&) {
      failed_to_start = true;
    }
  }
  // Getting here at all means a partially started pool was torn down.
  bool ok = expect(failed_to_start || started == 1000, "pool either starts fully or reports the failure");
  if(failed_to_start) {
    ok &= expect(ctx.logs.contains("Unable to start transfer worker"), "start failure logged");
  }
  ok &= expect(run_all(numbered_tasks(4), 2, [](const FileTransferTask&) { return TransferOutcome::ok(); }),
               "a new pool works once the limit is lifted");
  return ok;
}

bool test_dispatcher_empty_batch(TestContext&) {
  return expect(run_all({}, 1, [](const FileTransferTask&) { return TransferOutcome::failure("x"); }),
                "empty batch succeeds");
}

// ---- logging --------------------------------------------------------------

bool test_log_channels_reach_listeners(TestContext&) {
  bool ok = expect(std::string(log_channel_name(LogChannel::Report)) == "report", "report channel name");
  ok &= expect(log_channel_level(LogChannel::Verbose) == spdlog::level::debug, "verbose maps to spdlog debug");
  ok &= expect(log_channel_level(LogChannel::Debug) == spdlog::level::trace, "debug maps to spdlog trace");

  Logger logger("worker");
  std::vector<std::string> seen;
  auto handle = logger.add_listener([&](void*, const std::string& channel,
                                        spdlog::level::level_enum level, const std::string& message) {
    seen.push_back(channel + "|" + std::to_string(static_cast<int>(level)) + "|" + message);
    return true;
  });
  logger.verbose("copied {} files", 3);
  log_error(&logger, "bad {}", "rule");
  logger.remove_listener(handle);
  logger.info("after removal");

  std::vector<std::string> wanted = {"worker:verbose|1|copied 3 files", "worker:error|4|bad rule"};
  ok &= expect(seen == wanted, "listener saw [" + flat::test::join(seen) + "]");
  return ok;
}

// ---- settings and command line --------------------------------------------

std::vector<std::string> argv_of(std::initializer_list<const char*> items) {
  return std::vector<std::string>(items.begin(), items.end());
}

bool test_command_line_parsing(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser("flatten");
  parser.parse(argv_of({"in", "out", "--action", "MOVE", "-sep", "__", "--verify", "-w", "3", "-v", "off"}),
               settings);
  bool ok = expect(settings.get<std::string>("source_dir") == "in", "source positional");
  ok &= expect(settings.get<std::string>("destination_dir") == "out", "destination positional");
  ok &= expect(settings.get<std::string>("action") == "move", "action normalised");
  ok &= expect(settings.get<std::string>("separator") == "__", "separator alias");
  ok &= expect(settings.get<bool>("verify"), "bare bool flag");
  ok &= expect(settings.get<int>("workers") == 3, "worker count");
  ok &= expect(!settings.get<bool>("verbose"), "bool literal consumed");

  SettingsManager inline_form;
  parser.parse(argv_of({"--separator=--", "a", "b"}), inline_form);
  ok &= expect(inline_form.get<std::string>("separator") == "--", "inline value");
  return ok;
}

bool test_command_line_errors(TestContext&) {
  CommandLineParser parser("flatten");
  auto rejects = [&](std::vector<std::string> args) {
    SettingsManager settings;
    try {
      parser.parse(args, settings);
    } catch(const CommandLineError&) {
      return true;
    }
    return false;
  };
  bool ok = expect(rejects({"a", "b", "--action", "delete"}), "unknown action");
  ok &= expect(rejects({"a", "b", "--bogus"}), "unknown option");
  ok &= expect(rejects({"a", "b", "c"}), "extra positional");
  ok &= expect(rejects({"a", "b", "--workers", "-2"}), "negative workers");
  ok &= expect(rejects({"a", "b", "--workers"}), "missing value");
  return ok;
}

bool test_settings_round_trip(TestContext&) {
  flat::test::TempWorkspace ws("settings");
  auto path = ws.root() / ".config" / "flatten.json";
  SettingsManager settings;
  settings.set_settings_path(path);
  std::string error;
  bool ok = expect(settings.set_from_string("separator", "__", error), "set separator");
  ok &= expect(settings.set_from_string("source_dir", "/tmp/in", error), "set source");
  ok &= expect(settings.save(), "saved");

  SettingsManager reloaded;
  reloaded.set_settings_path(path);
  ok &= expect(reloaded.load(), "loaded");
  ok &= expect(reloaded.get<std::string>("separator") == "__", "persistent key restored");
  ok &= expect(reloaded.get<std::string>("source_dir").empty(), "non-persistent key not stored");
  return ok;
}

bool test_run_configuration_from_settings(TestContext&) {
  flat::test::TempWorkspace ws("config");
  write_file(ws.root() / "rules.json", R"([{"pattern": " ", "replacement": "_", "is_regex": false}])");
  SettingsManager settings;
  std::string error;
  settings.set_from_string("action", "move", error);
  settings.set_from_string("rules", (ws.root() / "rules.json").string(), error);
  settings.set_from_string("verify", "yes", error);

  auto config = run_configuration_from_settings(settings);
  bool ok = expect(config.action == TransferAction::Move, "action");
  ok &= expect(config.verify_hash, "verify");
  ok &= expect(config.separator == "++", "default separator");
  ok &= expect(config.worker_count >= 1 && config.worker_count == default_worker_count(), "auto workers");
  ok &= expect(config.rules.size() == 1, "rules loaded");

  settings.set_from_string("rules", (ws.root() / "none.json").string(), error);
  bool threw = false;
  try {
    run_configuration_from_settings(settings);
  } catch(const std::runtime_error&) {
    threw = true;
  }
  ok &= expect(threw, "missing rule file is fatal");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"sanitize_without_rules", test_sanitize_without_rules},
    {"sanitize_identity_when_nothing_matches", test_sanitize_identity_when_nothing_matches},
    {"sanitize_applies_rules_in_order", test_sanitize_applies_rules_in_order},
    {"sanitize_literal_replaces_all_occurrences", test_sanitize_literal_replaces_all_occurrences},
    {"sanitize_regex_with_group_references", test_sanitize_regex_with_group_references},
    {"sanitize_skips_empty_pattern", test_sanitize_skips_empty_pattern},
    {"sanitize_bad_regex_fails_only_that_rule", test_sanitize_bad_regex_fails_only_that_rule},
    {"template_translation", test_template_translation},
    {"template_rejects_unusable_group_references", test_template_rejects_unusable_group_references},
    {"rules_from_json", test_rules_from_json},
    {"rules_file_errors", test_rules_file_errors},
    {"sha256", test_sha256},
    {"copy_with_verification", test_copy_with_verification},
    {"copy_preserves_metadata", test_copy_preserves_metadata},
    {"move_with_verification", test_move_with_verification},
    {"move_without_verification", test_move_without_verification},
    {"transfer_error_becomes_outcome", test_transfer_error_becomes_outcome},
    {"hash_mismatch_keeps_destination", test_hash_mismatch_keeps_destination},
    {"dispatcher_runs_every_task", test_dispatcher_runs_every_task},
    {"dispatcher_failure_waits_for_batch", test_dispatcher_failure_waits_for_batch},
    {"dispatcher_bounds_concurrency", test_dispatcher_bounds_concurrency},
    {"dispatcher_rejects_zero_workers", test_dispatcher_rejects_zero_workers},
    {"dispatcher_converts_worker_exceptions", test_dispatcher_converts_worker_exceptions},
    {"dispatcher_converts_non_standard_exceptions", test_dispatcher_converts_non_standard_exceptions},
    {"dispatcher_start_failure_joins_started_threads", test_dispatcher_start_failure_joins_started_threads},
    {"dispatcher_empty_batch", test_dispatcher_empty_batch},
    {"log_channels_reach_listeners", test_log_channels_reach_listeners},
    {"command_line_parsing", test_command_line_parsing},
    {"command_line_errors", test_command_line_errors},
    {"settings_round_trip", test_settings_round_trip},
    {"run_configuration_from_settings", test_run_configuration_from_settings},
  };
  return flat::test::run_tests("unit", tests, argc, argv);
}
