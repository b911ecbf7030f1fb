#include <squad/common/credentials.hpp>
#include <squad/common/events.hpp>
#include <squad/common/exceptions.hpp>
#include <squad/orchestrator/orchestrator.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>
#include <thread>

#include <stdlib.h>
#include <sys/stat.h>

#include <fmt/format.h>
#include <gtest/gtest.h>

using namespace squad;
using namespace squad::orchestrator;

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    char name[] = "/tmp/squad-orchestrator-XXXXXX";
    ASSERT_NE(mkdtemp(name), nullptr);
    dir = name;

    cfg.kill_grace_period = 500;
    cfg.buffer_capacity = 100;
  }

  void TearDown() override
  {
    std::filesystem::remove_all(dir);
  }

  // Installs a shell script as the worker binary.
  void worker(const std::string& body)
  {
    auto path = dir / ("worker" + std::to_string(workers++) + ".sh");
    {
      std::ofstream out{path};
      out << "#!/bin/sh\n" << body << '\n';
    }
    chmod(path.c_str(), 0755);
    cfg.binary = path.string();
  }

  SpawnOptions options(const std::string& task = "t1")
  {
    SpawnOptions opts;
    opts.agent.id = "agent-1";
    opts.agent.name = "Agent";
    opts.task = task;
    opts.working_directory = dir.string();
    return opts;
  }

  static bool eventually(const std::function<bool()>& pred)
  {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
    while (std::chrono::steady_clock::now() < deadline) {
      if (pred()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return pred();
  }

  static std::vector<std::string> contents(const process::ProcessInfo& info)
  {
    std::vector<std::string> result;
    for (const auto& chunk : info.output->snapshot()) {
      result.push_back(chunk.content);
    }
    return result;
  }

  std::filesystem::path dir;
  config::Orchestrator cfg;
  int workers = 0;
};

TEST_F(OrchestratorTest, SpawnState)
{
  worker("exec sleep 5");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  EXPECT_GT(info.pid, 0);
  EXPECT_TRUE(info.state == process::State::STARTING || info.state == process::State::WORKING);
  EXPECT_EQ(info.task, "t1");
  EXPECT_EQ(info.agent_id, "agent-1");
  EXPECT_TRUE(info.id.starts_with("proc_"));

  auto record = orchestrator.get_process(info.id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->pid, info.pid);

  EXPECT_EQ(orchestrator.get_active_processes().size(), 1);
  EXPECT_EQ(orchestrator.get_processes_by_agent("agent-1").size(), 1);
  EXPECT_TRUE(orchestrator.get_processes_by_agent("other").empty());
  EXPECT_FALSE(orchestrator.get_process("proc_unknown").has_value());

  EXPECT_TRUE(orchestrator.kill(info.id));
}

TEST_F(OrchestratorTest, CostAccounting)
{
  worker(R"(
echo '{"type":"system","subtype":"init","session_id":"sess-1"}'
echo '{"type":"assistant","message":{"content":[{"type":"text","text":"hello"}]},"cost_usd":0.01}'
echo '{"type":"assistant","content":"step","cost_usd":0.02}'
echo '{"type":"result","result":"done","cost_usd":0.03}'
)");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  auto result = orchestrator.wait_for_process(info.id, std::chrono::seconds{10});
  ASSERT_TRUE(result.has_value());

  EXPECT_EQ(result->state, process::State::COMPLETED);
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_TRUE(result->ended_at.has_value());
  EXPECT_NEAR(orchestrator.get_total_cost(info.id), 0.06, 1e-9);
  EXPECT_EQ(orchestrator.get_session_id(info.id), "sess-1");

  EXPECT_EQ(
      contents(*result),
      (std::vector<std::string>{"init", "hello", "step", "done", "Process completed successfully"})
  );
  EXPECT_TRUE(result->output->closed());
}

TEST_F(OrchestratorTest, WorkerArguments)
{
  worker(R"(echo "$@")");
  Orchestrator orchestrator{cfg};

  auto opts = options("t1");
  opts.model = "sonnet";
  opts.max_turns = 3;
  auto info = orchestrator.spawn(opts);
  auto result = orchestrator.wait_for_process(info.id, std::chrono::seconds{10});
  ASSERT_TRUE(result.has_value());

  auto chunks = result->output->snapshot();
  ASSERT_FALSE(chunks.empty());
  EXPECT_EQ(chunks[0].kind, ChunkKind::RAW);
  EXPECT_EQ(
      chunks[0].content,
      "-p --output-format stream-json --model claude-sonnet-4-20250514 --max-turns 3 t1"
  );
}

TEST_F(OrchestratorTest, Environment)
{
  worker(R"(echo "$ANTHROPIC_API_KEY $NO_COLOR $FORCE_COLOR $AGENT_SETTING")");

  common::credentials::MemoryCredentialStore credentials;
  credentials.store(cfg.credential_service, cfg.credential_account, "secret-token");
  Orchestrator orchestrator{cfg, nullptr, &credentials};

  auto opts = options();
  opts.agent.environment["AGENT_SETTING"] = "value";
  auto info = orchestrator.spawn(opts);
  auto result = orchestrator.wait_for_process(info.id, std::chrono::seconds{10});
  ASSERT_TRUE(result.has_value());

  EXPECT_EQ(contents(*result).at(0), "secret-token 1 0 value");
}

TEST_F(OrchestratorTest, FailedWorker)
{
  worker("echo 'something broke' >&2\nexit 3");
  common::events::EventBus events;
  Orchestrator orchestrator{cfg, &events};

  auto info = orchestrator.spawn(options());
  auto result = orchestrator.wait_for_process(info.id, std::chrono::seconds{10});
  ASSERT_TRUE(result.has_value());

  EXPECT_EQ(result->state, process::State::ERROR);
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_EQ(result->error, "Process exited with code 3");

  auto chunks = result->output->snapshot();
  ASSERT_GE(chunks.size(), 2);
  EXPECT_EQ(chunks[0].stream, OutputStream::STDERR);
  EXPECT_EQ(chunks[0].kind, ChunkKind::ERROR);
  EXPECT_EQ(chunks[0].content, "something broke");

  EXPECT_TRUE(eventually([&]() {
    for (const auto& event : events.history()) {
      if (event.type() == common::events::EventType::AGENT_ERROR) {
        return true;
      }
    }
    return false;
  }));
  EXPECT_EQ(events.history().front().type(), common::events::EventType::AGENT_STARTED);
}

TEST_F(OrchestratorTest, InputRequest)
{
  worker(R"(
echo '{"type":"input_request","content":"Name?"}'
read answer
echo "{\"type\":\"assistant\",\"content\":\"got $answer\"}"
)");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  ASSERT_TRUE(eventually([&]() {
    return orchestrator.get_process(info.id)->state == process::State::WAITING;
  }));

  EXPECT_TRUE(orchestrator.send_input(info.id, "answer"));
  auto result = orchestrator.wait_for_process(info.id, std::chrono::seconds{10});
  ASSERT_TRUE(result.has_value());

  EXPECT_EQ(result->state, process::State::COMPLETED);
  auto output = contents(*result);
  EXPECT_NE(std::find(output.begin(), output.end(), "got answer"), output.end());

  EXPECT_FALSE(orchestrator.send_input(info.id, "late"));
  EXPECT_FALSE(orchestrator.send_input("proc_unknown", "text"));
}

TEST_F(OrchestratorTest, Kill)
{
  worker("exec sleep 30");
  common::events::EventBus events;
  Orchestrator orchestrator{cfg, &events};

  auto info = orchestrator.spawn(options());
  EXPECT_TRUE(orchestrator.kill(info.id));

  auto killed = orchestrator.get_process(info.id);
  ASSERT_TRUE(killed.has_value());
  EXPECT_EQ(killed->state, process::State::KILLED);
  ASSERT_TRUE(killed->ended_at.has_value());

  // The reaper fills in the exit code without touching the terminal state.
  ASSERT_TRUE(eventually([&]() { return killed->output->closed(); }));
  auto reaped = orchestrator.get_process(info.id);
  EXPECT_EQ(reaped->state, process::State::KILLED);
  EXPECT_EQ(reaped->ended_at, killed->ended_at);
  EXPECT_EQ(reaped->exit_code, common::Subprocess::SIGNAL_EXIT_BASE + SIGTERM);

  EXPECT_FALSE(orchestrator.kill(info.id));
  auto after = orchestrator.get_process(info.id);
  EXPECT_EQ(after->exit_code, reaped->exit_code);
  EXPECT_EQ(after->ended_at, reaped->ended_at);

  EXPECT_FALSE(orchestrator.kill("proc_unknown"));

  EXPECT_TRUE(eventually([&]() {
    for (const auto& event : events.history()) {
      if (event.type() == common::events::EventType::AGENT_COMPLETED) {
        return std::get<common::events::AgentCompleted>(event.payload).killed;
      }
    }
    return false;
  }));
}

TEST_F(OrchestratorTest, FailingSubscriberDoesNotBreakKill)
{
  worker("echo ready\nexec sleep 30");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  ASSERT_TRUE(eventually([&]() {
    return orchestrator.get_process(info.id)->state == process::State::WORKING;
  }));
  orchestrator.subscribe(info.id, [](const OutputChunk& chunk) {
    if (chunk.stream == OutputStream::SYSTEM) {
      throw std::runtime_error{"display failed"};
    }
  });

  EXPECT_NO_THROW(EXPECT_TRUE(orchestrator.kill(info.id)));
  ASSERT_TRUE(eventually([&]() { return info.output->closed(); }));

  auto output = contents(*orchestrator.get_process(info.id));
  EXPECT_EQ(output.at(0), "ready");
  EXPECT_EQ(output.at(1), fmt::format("Process terminated by user (signal {})", SIGTERM));
}

TEST_F(OrchestratorTest, KillEscalation)
{
  worker("trap '' TERM\necho ready\nwhile true; do sleep 1; done");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  ASSERT_TRUE(eventually([&]() {
    return orchestrator.get_process(info.id)->state == process::State::WORKING;
  }));

  EXPECT_TRUE(orchestrator.kill(info.id));
  ASSERT_TRUE(eventually([&]() { return info.output->closed(); }));
  EXPECT_EQ(
      orchestrator.get_process(info.id)->exit_code, common::Subprocess::SIGNAL_EXIT_BASE + SIGKILL
  );
}

TEST_F(OrchestratorTest, WaitForExitAfterKill)
{
  worker("trap '' TERM\necho ready\nwhile true; do sleep 1; done");
  cfg.kill_grace_period = 1000;
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  ASSERT_TRUE(eventually([&]() {
    return orchestrator.get_process(info.id)->state == process::State::WORKING;
  }));
  ASSERT_TRUE(orchestrator.kill(info.id));

  // The record is terminal at once while the child keeps running until SIGKILL.
  auto terminal = orchestrator.wait_for_process(info.id, std::chrono::milliseconds{0});
  ASSERT_TRUE(terminal.has_value());
  EXPECT_FALSE(terminal->exit_code.has_value());
  EXPECT_FALSE(orchestrator.wait_for_exit(info.id, std::chrono::milliseconds{100}).has_value());

  auto exited = orchestrator.wait_for_exit(info.id, std::chrono::seconds{10});
  ASSERT_TRUE(exited.has_value());
  EXPECT_EQ(exited->exit_code, common::Subprocess::SIGNAL_EXIT_BASE + SIGKILL);
  EXPECT_TRUE(exited->output->closed());

  EXPECT_FALSE(orchestrator.wait_for_exit("proc_unknown").has_value());
}

TEST_F(OrchestratorTest, PauseResume)
{
  worker("exec sleep 30");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  auto before = orchestrator.get_process(info.id)->state;

  EXPECT_TRUE(orchestrator.pause(info.id));
  EXPECT_EQ(orchestrator.get_process(info.id)->state, process::State::PAUSED);
  EXPECT_FALSE(orchestrator.pause(info.id));

  EXPECT_TRUE(orchestrator.resume(info.id));
  EXPECT_EQ(orchestrator.get_process(info.id)->state, before);
  EXPECT_FALSE(orchestrator.resume(info.id));

  // Paused workers can still be killed.
  EXPECT_TRUE(orchestrator.pause(info.id));
  EXPECT_TRUE(orchestrator.kill(info.id));
  ASSERT_TRUE(eventually([&]() { return info.output->closed(); }));
}

TEST_F(OrchestratorTest, WaitTimeout)
{
  worker("exec sleep 30");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  EXPECT_FALSE(orchestrator.wait_for_process(info.id, std::chrono::milliseconds{50}).has_value());
  EXPECT_FALSE(orchestrator.wait_for_process("proc_unknown").has_value());

  orchestrator.kill(info.id);
}

TEST_F(OrchestratorTest, SpawnErrors)
{
  worker("true");
  Orchestrator orchestrator{cfg};

  auto opts = options();
  opts.working_directory = (dir / "missing").string();
  EXPECT_THROW(orchestrator.spawn(opts), common::SpawnError);

  opts.working_directory = "";
  EXPECT_THROW(orchestrator.spawn(opts), common::SpawnError);

  cfg.binary = (dir / "no-such-worker").string();
  Orchestrator missing{cfg};
  EXPECT_THROW(missing.spawn(options()), common::SpawnError);

  EXPECT_TRUE(orchestrator.get_all_processes().empty());
  // Failed launches give their slot back.
  EXPECT_EQ(orchestrator.get_pool_stats().running, 0);
  EXPECT_EQ(missing.get_pool_stats().running, 0);
}

TEST_F(OrchestratorTest, ConcurrencyLimit)
{
  worker("exec sleep 30");
  cfg.max_concurrent = 1;
  Orchestrator orchestrator{cfg};

  auto first = orchestrator.spawn(options("t1"));
  EXPECT_EQ(orchestrator.get_pool_stats().running, 1);
  EXPECT_EQ(orchestrator.get_pool_stats().available, 0);

  std::optional<process::ProcessInfo> second;
  std::thread waiting{[&]() { second = orchestrator.spawn(options("t2")); }};

  ASSERT_TRUE(eventually([&]() { return orchestrator.get_pool_stats().queued == 1; }));
  EXPECT_EQ(orchestrator.get_all_processes().size(), 1);

  // The slot is handed over only once the first worker has been reaped.
  EXPECT_TRUE(orchestrator.kill(first.id));
  waiting.join();
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(orchestrator.get_process(first.id)->output->closed());
  EXPECT_EQ(second->task, "t2");

  auto stats = orchestrator.get_pool_stats();
  EXPECT_EQ(stats.running, 1);
  EXPECT_EQ(stats.queued, 0);
  EXPECT_EQ(stats.utilization_percent, 100);

  orchestrator.set_max_concurrent(3);
  EXPECT_EQ(orchestrator.get_pool_stats().available, 2);
  EXPECT_THROW(orchestrator.set_max_concurrent(0), common::InvalidConfigurationError);

  orchestrator.kill(second->id);
  ASSERT_TRUE(eventually([&]() { return orchestrator.get_pool_stats().running == 0; }));
}

TEST_F(OrchestratorTest, ShutdownRejectsQueuedSpawns)
{
  worker("exec sleep 30");
  cfg.max_concurrent = 1;
  Orchestrator orchestrator{cfg};

  orchestrator.spawn(options("t1"));

  bool rejected = false;
  std::thread waiting{[&]() {
    try {
      orchestrator.spawn(options("t2"));
    } catch (common::SpawnError&) {
      rejected = true;
    }
  }};
  ASSERT_TRUE(eventually([&]() { return orchestrator.get_pool_stats().queued == 1; }));

  orchestrator.shutdown();
  waiting.join();
  EXPECT_TRUE(rejected);
  EXPECT_EQ(orchestrator.get_all_processes().size(), 1);
}

TEST_F(OrchestratorTest, RemoveProcesses)
{
  worker("echo done");
  Orchestrator orchestrator{cfg};

  auto first = orchestrator.spawn(options());
  auto second = orchestrator.spawn(options());
  ASSERT_TRUE(orchestrator.wait_for_process(first.id, std::chrono::seconds{10}).has_value());
  ASSERT_TRUE(orchestrator.wait_for_process(second.id, std::chrono::seconds{10}).has_value());

  worker("exec sleep 30");
  Orchestrator long_running{cfg};
  auto active = long_running.spawn(options());
  EXPECT_FALSE(long_running.remove_process(active.id));
  long_running.kill(active.id);

  EXPECT_TRUE(orchestrator.remove_process(first.id));
  EXPECT_FALSE(orchestrator.remove_process(first.id));
  EXPECT_FALSE(orchestrator.get_process(first.id).has_value());

  EXPECT_EQ(orchestrator.clear_completed(), 1);
  EXPECT_TRUE(orchestrator.get_all_processes().empty());
}

TEST_F(OrchestratorTest, Subscribe)
{
  worker("echo one\necho two");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  ASSERT_TRUE(orchestrator.wait_for_process(info.id, std::chrono::seconds{10}).has_value());

  std::vector<std::string> received;
  bool completed = false;
  auto id = orchestrator.subscribe(
      info.id, [&](const OutputChunk& chunk) { received.push_back(chunk.content); },
      [&]() { completed = true; }
  );
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(
      received, (std::vector<std::string>{"one", "two", "Process completed successfully"})
  );
  EXPECT_TRUE(completed);

  EXPECT_FALSE(orchestrator.subscribe("proc_unknown", [](const OutputChunk&) {}).has_value());
}

TEST_F(OrchestratorTest, Shutdown)
{
  worker("exec sleep 30");
  Orchestrator orchestrator{cfg};

  auto info = orchestrator.spawn(options());
  orchestrator.shutdown();

  auto record = orchestrator.get_process(info.id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, process::State::KILLED);
  EXPECT_TRUE(record->output->closed());
  EXPECT_THROW(orchestrator.spawn(options()), common::SpawnError);
}
