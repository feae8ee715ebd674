// run_workflow: feed one message to the orchestrator and print the response
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "agentflow/agentflow.hpp"
#include "agents/builtin_agents.hpp"
#include "core/version.hpp"

using namespace agentflow;

namespace {

struct Options {
  std::optional<std::string> config_file;
  std::optional<double> timeout;
  bool sync = false;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::string input;  // Path, or "-" for stdin
};

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [options] <message.json | ->\n"
            << "\n"
            << "Options:\n"
            << "  --config FILE      Load configuration from FILE instead of the defaults\n"
            << "  --timeout SECONDS  Deadline for the run (default: config default_timeout_seconds)\n"
            << "  --sync             Run on this thread with no deadline\n"
            << "  --log-level LEVEL  trace/debug/info/warn/error/critical/off\n"
            << "  --log-file FILE    Log file path\n"
            << "  -h, --help         Show this help\n";
}

// Returns nullopt on a usage error
std::optional<Options> parse_args(int argc, char* argv[]) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

    if (arg == "--config") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.config_file = v;
    } else if (arg == "--timeout") {
      auto v = next();
      if (!v) return std::nullopt;
      try {
        size_t pos = 0;
        opts.timeout = std::stod(v, &pos);
        if (pos != std::strlen(v)) return std::nullopt;
      } catch (const std::exception&) {
        return std::nullopt;
      }
    } else if (arg == "--sync") {
      opts.sync = true;
    } else if (arg == "--log-level") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.log_level = v;
    } else if (arg == "--log-file") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.log_file = v;
    } else if (arg == "-" || arg.rfind("--", 0) != 0) {
      if (!opts.input.empty()) return std::nullopt;
      opts.input = arg;
    } else {
      return std::nullopt;
    }
  }
  if (opts.input.empty()) {
    return std::nullopt;
  }
  return opts;
}

std::optional<std::string> read_input(const std::string& input) {
  if (input == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream file(input);
  if (!file) {
    return std::nullopt;
  }
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
      std::cout << "run_workflow (agentflow " << AGENTFLOW_VERSION_STRING << ")\n";
      print_usage(argv[0]);
      return 0;
    }
  }

  auto opts = parse_args(argc, argv);
  if (!opts) {
    print_usage(argv[0]);
    return 2;
  }

  // Configuration
  Config config = opts->config_file ? Config::load(*opts->config_file) : Config::from_env();
  if (opts->log_level) config.log_level = *opts->log_level;
  if (opts->log_file) config.log_file = *opts->log_file;

  agentflow::init(config);

  // Message
  auto text = read_input(opts->input);
  if (!text) {
    std::cerr << "Error: cannot read " << opts->input << "\n";
    return 1;
  }
  json raw = json::parse(*text, nullptr, false);
  if (raw.is_discarded()) {
    std::cerr << "Error: " << opts->input << " is not valid JSON\n";
    return 1;
  }
  auto message = Message::from_json(raw);
  if (!message.ok()) {
    std::cerr << "Error: " << message.error->message << "\n";
    return 1;
  }

  // Broker with an audit trail of workflow outcomes
  auto broker = std::make_shared<MessageBroker>(config.broker.queue_capacity);
  broker->on_fatal([](const std::string& reason) { std::cerr << "[broker] fatal: " << reason << "\n"; });
  for (const char* topic : {topics::kWorkflowCompleted, topics::kWorkflowFailed, topics::kWorkflowTimedOut,
                            topics::kWorkflowWarning}) {
    broker->subscribe(topic, [topic](const Message& event) { std::cerr << "[" << topic << "] " << event.data().dump() << "\n"; });
  }
  broker->start();

  Response response;
  {
    Orchestrator orchestrator(config, broker);
    agents::register_builtin_agents(orchestrator);

    if (opts->sync) {
      response = orchestrator.process(*message.value);
    } else {
      response = orchestrator.process_async(*message.value, opts->timeout.value_or(config.default_timeout_seconds));
    }

    auto runs = orchestrator.stats();
    spdlog::info("[run_workflow] Runs: completed={} failed={} timed_out={} direct_timeouts={} rejected={}",
                 runs.runs_completed, runs.runs_failed, runs.runs_timed_out, runs.direct_timeouts, runs.rejected);
  }

  std::cout << response.to_json().dump(2) << std::endl;

  // Flush the audit events before exiting
  broker->stop();

  auto stats = broker->stats();
  spdlog::info("[run_workflow] Broker: published={} delivered={} rejected={} subscriber_failures={}", stats.published,
               stats.delivered, stats.rejected, stats.subscriber_failures);

  return response.ok() ? 0 : 1;
}
