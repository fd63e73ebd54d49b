#include <contractdb/Commands.hpp>
#include <contractdb/Config.hpp>
#include <contractdb/ConfigFile.hpp>
#include <contractdb/log.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace contractdb;

int main(int argc, char* argv[])
{
   namespace po = boost::program_options;

   DatabaseConfig           cfg;
   std::string              configFile;
   std::vector<std::string> command;

   po::options_description common_opts("Options");
   addDatabaseOptions(common_opts, cfg);
   po::options_description desc("contractdb");
   desc.add(common_opts);
   desc.add_options()("config,c", po::value(&configFile)->value_name("file"),
                      "Read options from a config file")("help,h", "Show this message");
   po::options_description hidden;
   hidden.add_options()("command", po::value(&command));
   po::options_description all;
   all.add(desc).add(hidden);
   po::positional_options_description positional;
   positional.add("command", -1);

   po::variables_map vm;
   try
   {
      po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
      // Command line options take precedence over the config file,
      // because the first value stored for an option wins
      if (vm.count("config"))
      {
         auto          path = vm["config"].as<std::string>();
         std::ifstream in(path);
         if (!in)
            throw std::runtime_error("cannot open config file " + path);
         po::store(parse_config_file(in, common_opts, path), vm);
      }
      po::notify(vm);
   }
   catch (std::exception& e)
   {
      if (!vm.count("help"))
      {
         std::cerr << e.what() << "\n";
         return 1;
      }
   }

   if (vm.count("help") || command.empty())
   {
      std::cerr << "USAGE: contractdb [options] <command> [args]\n\n";
      std::cerr << commandUsage() << "\n\n";
      std::cerr << desc << "\n";
      return 1;
   }

   loggers::configure(cfg.logLevel);
   return runCommand(command, cfg, std::cout, std::cerr);
}
