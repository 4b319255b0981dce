#include "../AgentClient.hpp"
#include "../AgentTable.hpp"
#include "../Cli.hpp"
#include "../Cmd.hpp"
#include "../Config.hpp"
#include "../Rustify/Result.hpp"
#include "Common.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gocov {

static Result<void> listMain(CliArgsView args);

const Subcmd LIST_CMD =
    Subcmd{ "list" }
        .setDesc("List the agents registered with a coverage server")
        .addOpt(
            Opt{ "--host" }
                .setDesc("Coverage server to query")
                .setPlaceholder("<URL>")
                .setDefault(AgentClient::DEFAULT_HOST)
        )
        .addOpt(
            Opt{ "--wide" }
                .setShort("-w")
                .setDesc("Show hostname and pid, and the full command line")
        )
        .setMainFn(listMain);

static Result<void>
listMain(const CliArgsView args) {
  // Parse args
  std::optional<std::string> host;
  bool wide = false;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(Cli::handleGlobalOpts(itr, args.end(), "list"));
    if (control == Cli::Return) {
      return Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "--host") {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      host = *++itr;
    } else if (arg == "-w" || arg == "--wide") {
      wide = true;
    } else {
      return LIST_CMD.noSuchArg(arg);
    }
  }

  const Config config = Try(Config::load(fs::current_path()));
  if (!host.has_value()) {
    host = config.listHost.value_or(std::string(AgentClient::DEFAULT_HOST));
  }

  const AgentClient client =
      Try(AgentClient::create(host.value()).map_err(toAnyhow));
  const std::vector<Agent> agents = Try(client.listAgents().map_err(toAnyhow));
  fmt::print("{}", renderAgentTable(agents, wide || config.listWide));
  return Ok();
}

}  // namespace gocov
