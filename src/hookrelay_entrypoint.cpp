#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "conf/hookrelay_config.hpp"
#include "handlers/listen_handler.hpp"
#include "hookrelay_common.hpp"
#include "hookrelay_entry.hpp"
#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

namespace po = boost::program_options;

int RunHookrelayApplication(int argc, char *argv[]) {
  // Version requests skip every other step, config loading included.
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i] ? argv[i] : "");
    if (arg == "--version" || arg == "version") {
      std::cout << HOOKRELAY_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("hookrelay: forward webhook events "
                                         "to a local endpoint");

    hookrelay::CliParams cli_params;

    generic_desc.add_options() //
        ("config-dir",
         po::value<std::string>()->value_name("DIR")->notifier(
             [&](const std::string &value) { cli_params.config_dir = value; }),
         "configuration directory (default ~/.config/hookrelay).") //
        ("profile",
         po::value<std::string>(&cli_params.profile)->default_value("default"),
         "profile to use from config.json.") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all output.") //
        ("api-key",
         po::value<std::string>()->value_name("KEY")->notifier(
             [&](const std::string &value) {
               cli_params.api_key_override = value;
             }),
         "API key for this run.") //
        ("project-id",
         po::value<std::string>()->value_name("ID")->notifier(
             [&](const std::string &value) {
               cli_params.project_id_override = value;
             }),
         "project identifier for this run.") //
        ("api-base",
         po::value<std::string>()->value_name("URL")->notifier(
             [&](const std::string &value) {
               cli_params.api_base_override = value;
             }),
         "override the API base URL for this run.") //
        ("version", "print the version.")           //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1); // command will get all positional arguments.

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    if (!positionals.empty()) {
      cli_params.subcmd = positionals[0];
    }

    std::vector<std::string> unrecognized = po::collect_unrecognized(
        parsed.options, po::collect_unrecognized_mode::include_positional);

    auto showUsage = [&]() {
      std::cerr << generic_desc << std::endl;
      std::cerr << "Subcommands:" << std::endl;
      std::cerr << "  listen         Forward webhook events to a local "
                   "endpoint."
                << std::endl
                << std::endl;
    };

    if (vm.count("help")) {
      if (cli_params.subcmd == "listen") {
        std::cout << hookrelay::listen_usage() << std::endl;
      } else {
        showUsage();
      }
      return EXIT_SUCCESS;
    }

    if (cli_params.subcmd.empty()) {
      showUsage();
      return 2;
    }

    const auto config_dir =
        hookrelay::resolve_config_dir(cli_params.config_dir,
                                      hookrelay::process_env);
    auto config_r = hookrelay::load_hookrelay_config(
        config_dir, cli_params.profile, hookrelay::process_env);
    if (config_r.is_err()) {
      std::cerr << "Failed to load configuration: " << config_r.error().what
                << std::endl;
      return my_errors::exit_code_for(config_r.error().code);
    }
    init_my_log(config_r.value().log);
    auto lg = make_logger_with_session("-");
    BOOST_LOG_SEV(*lg, trivial::debug)
        << "config dir: " << config_dir.string() << ", profile "
        << cli_params.profile;

    // reference variable be here.
    static hookrelay::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                     std::move(unrecognized),
                                     std::move(cli_params));

    if (!cli_ctx.is_specified_by_user("verbose")) {
      cli_ctx.params.verbose = config_r.value().verbose;
    }

    return hookrelay::launch(cli_ctx);
  } catch (const po::error &e) {
    std::cerr << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "error caught on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunHookrelayApplication(argc, argv); }
