// Granite
// Copyright (c) 2015 Sandstorm Development Group, Inc.
// All Rights Reserved
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include <kj/main.h>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <capnp/rpc-twoparty.h>
#include <capnp/serialize.h>
#include <sandstorm/util.h>
#include <granite/config.capnp.h>
#include "node.h"
#include "remote-disk.h"
#include "logs.h"
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>

namespace granite {

class NodeHooks final: public LoggingPeerHooks {
  // Peer hooks of a running server. "stop" and "restart" end the server shortly after the
  // call is acknowledged; the daemon restarts a server that exits with an error.

public:
  NodeHooks(kj::Timer& timer, kj::Own<kj::PromiseFulfiller<bool>> fulfiller)
      : timer(timer), fulfiller(kj::mv(fulfiller)) {}

  kj::Promise<void> signalService(kj::StringPtr signal) override {
    if (signal == "stop" || signal == "restart") {
      KJ_LOG(INFO, "peer requested shutdown", signal);
      bool stop = signal == "stop";
      exiting = timer.afterDelay(100 * kj::MILLISECONDS).then([this,stop]() {
        fulfiller->fulfill(kj::cp(stop));
      }).eagerlyEvaluate([](kj::Exception&& exception) {
        KJ_LOG(ERROR, "shutdown failed", exception);
      });
      return kj::READY_NOW;
    } else {
      return LoggingPeerHooks::signalService(signal);
    }
  }

private:
  kj::Timer& timer;
  kj::Own<kj::PromiseFulfiller<bool>> fulfiller;
  kj::Promise<void> exiting = nullptr;
};

class Main {
public:
  Main(kj::ProcessContext& context): context(context) {
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  }

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Granite version " GRANITE_VERSION,
                           "Runs a Granite storage node.")
        .addSubCommand("server", KJ_BIND_METHOD(*this, getServerMain),
            "run a node in the foreground")
        .addSubCommand("start", KJ_BIND_METHOD(*this, getStartMain), "start a node as daemon")
        .addSubCommand("signal", KJ_BIND_METHOD(*this, getSignalMain),
            "send a service signal to a running node")
        .build();
  }

  kj::MainFunc getServerMain() {
    return kj::MainBuilder(context, "Granite version " GRANITE_VERSION,
                           "Runs a Granite node in foreground, logging to stderr.")
        .expectArg("<config>", KJ_BIND_METHOD(*this, runServer))
        .build();
  }

  kj::MainFunc getStartMain() {
    return kj::MainBuilder(context, "Granite version " GRANITE_VERSION,
                           "Starts a Granite node as daemon, logging to the configured log "
                           "directory. The node is restarted whenever it fails.")
        .expectArg("<config>", KJ_BIND_METHOD(*this, runDaemon))
        .build();
  }

  kj::MainFunc getSignalMain() {
    return kj::MainBuilder(context, "Granite version " GRANITE_VERSION,
                           "Sends <signal> (e.g. \"stop\" or \"restart\") to the node listening "
                           "on <address>.")
        .expectArg("<address>", KJ_BIND_METHOD(*this, setAddress))
        .expectArg("<signal>", KJ_BIND_METHOD(*this, runSignal))
        .build();
  }

private:
  kj::ProcessContext& context;
  kj::String signalAddress;

  bool runServer(kj::StringPtr configFile) {
    KJ_LOG(INFO, "*** Starting Granite node ***");
    initCrypto();

    capnp::StreamFdMessageReader configReader(
        sandstorm::raiiOpen(configFile, O_RDONLY | O_CLOEXEC));
    auto config = configReader.getRoot<NodeConfig>();

    auto ioContext = kj::setupAsyncIo();
    auto& timer = ioContext.provider->getTimer();
    auto paf = kj::newPromiseAndFulfiller<bool>();
    NodeHooks hooks(timer, kj::mv(paf.fulfiller));

    Node node(config, ioContext.provider->getNetwork(), timer, hooks);
    auto stopped = node.listen().then([]() { return false; });
    bool stop = stopped.exclusiveJoin(kj::mv(paf.promise)).wait(ioContext.waitScope);
    KJ_LOG(INFO, "node shutting down", stop ? "stop" : "restart");
    return stop;
  }

  bool runDaemon(kj::StringPtr configFile) {
    kj::String logDir;
    {
      capnp::StreamFdMessageReader configReader(
          sandstorm::raiiOpen(configFile, O_RDONLY | O_CLOEXEC));
      logDir = kj::heapString(configReader.getRoot<NodeConfig>().getLogDir());
    }
    if (logDir.size() == 0) {
      context.exitError("config has no logDir");
    }
    auto configPath = kj::heapString(configFile);

    sandstorm::Subprocess([&]() -> int {
      // Detach from controlling terminal and make ourselves session leader.
      KJ_SYSCALL(setsid());

      for (;;) {
        bool stopped = false;
        KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
          auto logPipe = sandstorm::Pipe::make();

          // Fork again so that we are no longer session leader.
          sandstorm::Subprocess server([&]() -> int {
            KJ_SYSCALL(dup2(logPipe.writeEnd, STDOUT_FILENO));
            KJ_SYSCALL(dup2(logPipe.writeEnd, STDERR_FILENO));
            logPipe.readEnd = nullptr;
            logPipe.writeEnd = nullptr;
            KJ_SYSCALL(prctl(PR_SET_NAME, "granite-node", 0, 0, 0));
            return runServer(configPath) ? 0 : 1;
          });

          // Parent records logs.
          logPipe.writeEnd = nullptr;
          sandstorm::recursivelyCreateParent(kj::str(logDir, "/dummy"));
          auto logDirFd = sandstorm::raiiOpen(logDir, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
          rotateLogs(logPipe.readEnd, logDirFd);
          server.waitForSuccess();
          stopped = true;
        })) {
          KJ_LOG(ERROR, "node exited; restarting", *exception);
          sleep(1);
        }
        if (stopped) break;
      }

      return 0;
    }).detach();

    context.exitInfo("Granite started");
  }

  kj::MainBuilder::Validity setAddress(kj::StringPtr arg) {
    signalAddress = kj::heapString(arg);
    return true;
  }

  bool runSignal(kj::StringPtr signal) {
    auto ioContext = kj::setupAsyncIo();
    auto address = ioContext.provider->getNetwork().parseAddress(signalAddress)
        .wait(ioContext.waitScope);
    auto stream = address->connect().wait(ioContext.waitScope);
    capnp::TwoPartyClient client(*stream);
    auto service = client.bootstrap().castAs<NodeService>();

    PropertyMap vars;
    setProperty(vars, "signal", kj::heapString(signal));
    auto request = service.signalServiceRequest();
    request.setVars(encodeProperties(vars));
    auto response = request.send().wait(ioContext.waitScope);
    checkResponse(response);

    context.exitInfo(kj::str("sent ", signal, " to ", signalAddress));
  }
};

}  // namespace granite

KJ_MAIN(granite::Main)
