#include "../Cli.hpp"
#include "../Cmd.hpp"
#include "../Rustify/Result.hpp"

namespace gocov {

static Result<void> helpMain(CliArgsView args);

const Subcmd HELP_CMD =  //
    Subcmd{ "help" }
        .setDesc("Displays help for a gocov subcommand")
        .addArg(Arg{ "COMMAND" }.setRequired(false))
        .setMainFn(helpMain);

static Result<void>
helpMain(const CliArgsView args) {
  return getCli().printHelp(args);
}

}  // namespace gocov
