#include <gtest/gtest.h>

#include "../coordination/include/control_client.hpp"
#include "../coordination/include/instance_manager.hpp"
#include "../coordination/include/proxy.hpp"
#include "test_utils.hpp"

#include <csignal>
#include <vector>

/*
 * Multi-process scenarios: forked children play the other instances.
 * Children only use the coordination classes and leave through _exit().
 */

namespace {

// Waits for one byte on fd; false on timeout or EOF.
bool read_byte(int fd, char& out, int timeout_ms) {
  pollfd pfd{};
  pfd.fd     = fd;
  pfd.events = POLLIN;
  if (poll(&pfd, 1, timeout_ms) <= 0) {
    return false;
  }
  return read(fd, &out, 1) == 1;
}

/**
 * Forks a main instance on port: wins the election with version, then serves
 * the control-plane on the election socket until killed or told to shut down.
 * @return child pid, or -1 if it never became ready
 */
pid_t spawn_main(uint16_t port, const fs::path& lockPath, const std::string& version,
                 ControlPlaneBehavior behavior = {}) {
  int ready[2];
  if (pipe(ready) != 0) {
    return -1;
  }

  pid_t child = fork();
  if (child < 0) {
    return -1;
  }
  if (child == 0) {
    close(ready[0]);
    FileLockStore  lockStore(lockPath);
    TcpServicePort servicePort(port);
    LeaderElection election(servicePort, lockStore, version);

    bool won = false;
    try {
      won = election.TryBecomeMain();
    } catch (const std::exception& ex) {
      log_line(LogLevel::ERROR, string("test main: ") + ex.what());
      _exit(3);
    }
    if (!won) {
      _exit(2);
    }

    // The dup keeps the port bound while the control-plane owns it.
    sock_t listener = dup(servicePort.Socket());
    servicePort.Release();

    behavior.versionBody = "{\"version\":\"" + version + "\"}";
    if (behavior.releasePortOnShutdown) {
      behavior.onShutdown = []() { _exit(0); };
    }
    FakeControlPlane controlPlane(listener, behavior);

    char ok = 'R';
    if (write(ready[1], &ok, 1) != 1) {
      _exit(4);
    }
    while (true) {
      pause();
    }
  }

  close(ready[1]);
  char ok = 0;
  bool started = read_byte(ready[0], ok, 5000);
  close(ready[0]);
  if (!started) {
    kill(child, SIGKILL);
    wait_child(child);
    return -1;
  }
  return child;
}

struct Instance {
  FileLockStore           lockStore;
  TcpServicePort          servicePort;
  ProcessLivenessChecker  liveness;
  HttpVersionNegotiator   negotiator;
  HttpShutdownCoordinator shutdownCoordinator;
  InstanceManager         manager;

  Instance(uint16_t port, const fs::path& lockPath, CoordinatorConfig config)
      : lockStore(lockPath),
        servicePort(port),
        negotiator(1000),
        shutdownCoordinator(servicePort, 1000, 20),
        manager(std::move(config), servicePort, lockStore, liveness, negotiator, shutdownCoordinator) {}
};

CoordinatorConfig config_for(const std::string& version, int handoverTimeoutMs = 5000) {
  CoordinatorConfig config;
  config.version           = version;
  config.bindRetries       = 10;
  config.backoffMs         = 20;
  config.handoverTimeoutMs = handoverTimeoutMs;
  return config;
}

class HandoverTest : public ::testing::Test {
protected:
  uint16_t port{0};
  fs::path lockPath;
  std::vector<pid_t> children;

  void SetUp() override {
    port = pick_free_port();
    ASSERT_NE(port, 0);
    lockPath = unique_lock_path("handover");
  }

  void TearDown() override {
    for (pid_t child : children) {
      kill(child, SIGKILL);
      wait_child(child);
    }
    std::error_code ec;
    fs::remove(lockPath, ec);
  }
};

}  // namespace

TEST_F(HandoverTest, SameVersionStartBecomesProxyToRunningMain) {
  pid_t mainPid = spawn_main(port, lockPath, "1.0.0");
  ASSERT_GT(mainPid, 0);
  children.push_back(mainPid);

  Instance instance(port, lockPath, config_for("1.0.0"));
  ASSERT_EQ(instance.manager.Negotiate(), InstanceRole::PROXY);
  ASSERT_TRUE(instance.manager.State().lock.has_value());
  EXPECT_EQ(instance.manager.State().lock->ownerPid, mainPid);

  // The main's record is untouched.
  auto record = instance.lockStore.Read();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->ownerPid, mainPid);
  EXPECT_EQ(record->protocolVersion, "1.0.0");

  ProxyTransport proxy(0);
  uint16_t proxyPort = proxy.StartProxy(*instance.manager.State().lock);
  ControlResponse viaProxy = ControlClient(LOCAL_HOST, proxyPort, 2000).get("/hello");
  ASSERT_TRUE(viaProxy.success) << viaProxy.error;
  EXPECT_EQ(viaProxy.body, "hello from main");
}

TEST_F(HandoverTest, NewerVersionReplacesRunningMain) {
  pid_t mainPid = spawn_main(port, lockPath, "1.0.0");
  ASSERT_GT(mainPid, 0);

  Instance instance(port, lockPath, config_for("1.1.0"));
  EXPECT_EQ(instance.manager.Negotiate(), InstanceRole::MAIN);
  EXPECT_EQ(wait_child(mainPid), 0);

  auto record = instance.lockStore.Read();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->ownerPid, ::getpid());
  EXPECT_EQ(record->protocolVersion, "1.1.0");
  EXPECT_TRUE(instance.servicePort.IsHeld());
}

TEST_F(HandoverTest, OlderVersionAlsoTakesOver) {
  pid_t mainPid = spawn_main(port, lockPath, "2.0.0");
  ASSERT_GT(mainPid, 0);

  Instance instance(port, lockPath, config_for("1.9.0"));
  EXPECT_EQ(instance.manager.Negotiate(), InstanceRole::MAIN);
  EXPECT_EQ(wait_child(mainPid), 0);
  EXPECT_EQ(instance.lockStore.Read()->protocolVersion, "1.9.0");
}

TEST_F(HandoverTest, MainThatKeepsThePortFailsTheHandover) {
  ControlPlaneBehavior stubborn;
  stubborn.releasePortOnShutdown = false;
  pid_t mainPid = spawn_main(port, lockPath, "1.0.0", stubborn);
  ASSERT_GT(mainPid, 0);
  children.push_back(mainPid);

  // Acknowledges the shutdown but keeps running with the port bound.
  Instance instance(port, lockPath, config_for("1.1.0", 300));
  uint64_t start = now_ms();
  EXPECT_THROW(instance.manager.Negotiate(), std::runtime_error);
  EXPECT_LT(now_ms() - start, 3000u);
  EXPECT_FALSE(instance.servicePort.IsHeld());
}

TEST_F(HandoverTest, LockOfExitedMainIsReplaced) {
  pid_t mainPid = spawn_main(port, lockPath, "1.0.0");
  ASSERT_GT(mainPid, 0);
  kill(mainPid, SIGKILL);
  wait_child(mainPid);

  FileLockStore lockStore(lockPath);
  ASSERT_TRUE(lockStore.Read().has_value());

  Instance instance(port, lockPath, config_for("1.0.0"));
  EXPECT_EQ(instance.manager.Negotiate(), InstanceRole::MAIN);
  EXPECT_EQ(lockStore.Read()->ownerPid, ::getpid());
}

TEST_F(HandoverTest, ConcurrentStartsElectExactlyOneMain) {
  constexpr int kInstances = 4;
  int go[2];
  int results[2];
  ASSERT_EQ(pipe(go), 0);
  ASSERT_EQ(pipe(results), 0);

  for (int i = 0; i < kInstances; ++i) {
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
      close(go[1]);
      close(results[0]);
      char start = 0;
      if (!read_byte(go[0], start, 10000)) {
        _exit(5);
      }

      Instance instance(port, lockPath, config_for("1.0.0"));
      InstanceRole role = InstanceRole::ELECTING;
      try {
        role = instance.manager.Negotiate();
      } catch (const std::exception& ex) {
        log_line(LogLevel::ERROR, string("test instance: ") + ex.what());
        _exit(3);
      }

      char tag = role == InstanceRole::MAIN ? 'M' : 'P';
      if (role == InstanceRole::PROXY) {
        _exit(write(results[1], &tag, 1) == 1 ? 11 : 4);
      }

      sock_t listener = dup(instance.servicePort.Socket());
      instance.servicePort.Release();
      FakeControlPlane controlPlane(listener, {});
      if (write(results[1], &tag, 1) != 1) {
        _exit(4);
      }
      while (true) {
        pause();
      }
    }
    children.push_back(child);
  }

  close(go[0]);
  close(results[1]);
  // One byte per child releases them all at once.
  std::string start(kInstances, 'G');
  ASSERT_EQ(write(go[1], start.data(), start.size()), static_cast<ssize_t>(start.size()));
  close(go[1]);

  int mains = 0;
  int proxies = 0;
  for (int i = 0; i < kInstances; ++i) {
    char tag = 0;
    ASSERT_TRUE(read_byte(results[0], tag, 15000)) << "instance " << i << " never decided";
    if (tag == 'M') {
      ++mains;
    } else if (tag == 'P') {
      ++proxies;
    }
  }
  close(results[0]);

  EXPECT_EQ(mains, 1);
  EXPECT_EQ(proxies, kInstances - 1);

  FileLockStore lockStore(lockPath);
  auto record = lockStore.Read();
  ASSERT_TRUE(record.has_value());
  ProcessLivenessChecker liveness;
  EXPECT_TRUE(liveness.IsAlive(record->ownerPid));
}
