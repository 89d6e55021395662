#include "argparse.h"

#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include "stringutils.h"
#include "log.h"

#ifndef VERSION_STRING
#define VERSION_STRING "dev"
#endif

const struct option long_options[] =
{
   {"cfg_file", required_argument, nullptr, 'c'},
   {"format",   required_argument, nullptr, 'f'},
   {"ioi",      required_argument, nullptr, 'i'},
   {"mri",      required_argument, nullptr, 'm'},
   {"output",   required_argument, nullptr, 'o'},
   {"override", required_argument, nullptr, 'O'},
   {"rri",      required_argument, nullptr, 'r'},
   {"symbols",  no_argument, nullptr, 's'},
   {"version",  no_argument, nullptr, 'V'},
   {"help",     no_argument, nullptr, 'h'},
   {"verbose",  no_argument, nullptr, 'v'},
   {nullptr, 0, nullptr, 0},
};

void usage(std::ostream &os, char *progPath, int errcode)
{
   std::string progname, dirname;

   stringutils::splitPath(progPath, dirname, progname);

   os << "Usage: " << progname << " [options] <file.asm>\n";
   os << "\nSupported options are:\n";
   os << "   -c/--cfg_file=<file>:   read assembler settings from <file>.\n";
   os << "   -f/--format=<bin|hex>:  listing format (default: bin).\n";
   os << "   -h/--help:              shows this help\n";
   os << "   -i/--ioi=<file>:        input/output instruction table (default: built-in)\n";
   os << "   -m/--mri=<file>:        memory-reference instruction table (default: built-in)\n";
   os << "   -o/--output=<file>:     write the listing to <file> instead of the standard output\n";
   os << "   -O/--override:          override an option from the config. Can be repeated. (example: -O assembler.require_end=1)\n";
   os << "   -r/--rri=<file>:        register-reference instruction table (default: built-in)\n";
   os << "   -s/--symbols:           also print the label table\n";
   os << "   -V/--version:           outputs version and exit\n";
   os << "   -v/--verbose:           be talkative\n";
   os << "\nTable files hold one '<mnemonic> <binary encoding>' pair per line.\n";
   os << "\nExample: " << progname << " -f hex program.asm\n";
   exit(errcode);
}

void parseArguments(int argc, char **argv, std::vector<std::string>& source_list, BcasmArgs& args)
{
   int option_index = 0;
   int c;

   optind = 0; // To please test framework, when this function is called multiple times !
   while(true) {
      c = getopt_long (argc, argv, "c:f:hi:m:o:O:r:svV",
                       long_options, &option_index);
      // Logs before processing of the -v will not be visible.
      LOG_DEBUG("Next option: " << c << "(" << static_cast<char>(c) << ")");

      /* Detect the end of the options. */
      if (c == -1)
         break;

      switch (c)
      {
         case 'c':
            args.cfgFilePath = optarg;
            break;

         case 'f':
            args.format = optarg;
            break;

         case 'h':
            usage(std::cout, argv[0], 0);
            break;

         case 'i':
            args.ioiPath = optarg;
            break;

         case 'm':
            args.mriPath = optarg;
            break;

         case 'o':
            args.outputPath = optarg;
            break;

         case 'O':
            {
              std::string opt(optarg);
              bool invalid = false;
              auto key_value_separator = opt.find('=');
              if (key_value_separator == std::string::npos) invalid = true;
              std::string key = opt.substr(0, key_value_separator);
              std::string value = opt.substr(key_value_separator+1);
              auto section_item_separator = key.find('.');
              if (section_item_separator == std::string::npos) invalid = true;
              std::string section = key.substr(0, section_item_separator);
              std::string item = key.substr(section_item_separator+1);
              if (invalid || section.empty() || item.empty()) {
                LOG_ERROR("Couldn't parse override: '" << opt << "'");
              } else {
                args.cfgOverrides[section][item] = value;
                LOG_VERBOSE("Override configuration: " << section << "." << item << " = " << value);
              }
              break;
            }

         case 'r':
            args.rriPath = optarg;
            break;

         case 's':
            args.symbols = true;
            break;

         case 'v':
            log_verbose = true;
            break;

         case 'V':
            std::cout << "bcasm " << VERSION_STRING << "\n";
            exit(0);
            break;

         case '?':
         default:
            usage(std::cerr, argv[0], 1);
            break;
       }
   }

   /* All remaining command line arguments are source files */
   source_list.assign(argv+optind, argv+argc);
   LOG_DEBUG("source_list: " << stringutils::join(source_list, ","))
}
