#include "gtest/gtest.h"

#include <sys/wait.h>

#include <cstdio>
#include <format>
#include <string>

#ifndef PULSEWIRE_BIN_PATH
#define PULSEWIRE_BIN_PATH "pulsewire"
#endif

namespace {

const std::string kBin = PULSEWIRE_BIN_PATH;

struct Invocation {
  int status{-1}; // exit status, or -1 if the shell could not run it
  std::string output; // stdout and stderr interleaved
};

auto run_pulsewire(const std::string &args) -> Invocation {
  Invocation out;
  const auto command = std::format("{} {} 2>&1", kBin, args);
  FILE *pipe = ::popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return out;
  }
  char line[256];
  while (std::fgets(line, sizeof(line), pipe) != nullptr) {
    out.output += line;
  }
  const int raw = ::pclose(pipe);
  out.status = WIFEXITED(raw) ? WEXITSTATUS(raw) : -1;
  return out;
}

} // namespace

TEST(PulsewireCli, NoArgsShowsHelp) {
  auto r = run_pulsewire("");
  EXPECT_NE(r.status, 0);
  EXPECT_FALSE(r.output.empty());
}

TEST(PulsewireCli, HelpFlag) {
  auto r = run_pulsewire("--help");
  EXPECT_EQ(r.status, 0);
  EXPECT_NE(r.output.find("serve"), std::string::npos);
  EXPECT_NE(r.output.find("listen"), std::string::npos);
}

TEST(PulsewireCli, ServeSubcommandHelp) {
  auto r = run_pulsewire("serve --help");
  EXPECT_EQ(r.status, 0);
  EXPECT_NE(r.output.find("--port"), std::string::npos);
  EXPECT_NE(r.output.find("--simulate"), std::string::npos);
}

TEST(PulsewireCli, ListenSubcommandHelp) {
  auto r = run_pulsewire("listen --help");
  EXPECT_EQ(r.status, 0);
  EXPECT_NE(r.output.find("--subscribe"), std::string::npos);
  EXPECT_NE(r.output.find("--no-reconnect"), std::string::npos);
  EXPECT_NE(r.output.find("valid-token"), std::string::npos);
}

TEST(PulsewireCli, ServeRejectsMissingConfigFile) {
  auto r = run_pulsewire("serve -c /nonexistent/pulsewire.toml");
  EXPECT_NE(r.status, 0);
}

TEST(PulsewireCli, ServeRejectsUnknownLogLevel) {
  auto r = run_pulsewire("serve --port 0 --log-level chatty");
  EXPECT_NE(r.status, 0);
  EXPECT_NE(r.output.find("invalid override"), std::string::npos);
}

TEST(PulsewireCli, ListenRejectsNonWebSocketUrl) {
  auto r = run_pulsewire("listen --url http://127.0.0.1:1/ws");
  EXPECT_NE(r.status, 0);
}

TEST(PulsewireCli, ListenWithoutReconnectExitsWhenHubIsDown) {
  auto r = run_pulsewire("listen --url ws://127.0.0.1:1/ws --no-reconnect");
  EXPECT_NE(r.status, 0);
}
