#ifndef ARGPARSE_H
#define ARGPARSE_H

#include <map>
#include <string>
#include <vector>

class BcasmArgs
{
   public:
      BcasmArgs() = default;
      std::string cfgFilePath;
      std::string mriPath;
      std::string rriPath;
      std::string ioiPath;
      std::string format;          // "bin" or "hex", empty = from config
      std::string outputPath;      // empty = stdout
      bool symbols = false;
      std::map<std::string, std::map<std::string, std::string>> cfgOverrides;
};

void parseArguments(int argc, char** argv, std::vector<std::string>& source_list, BcasmArgs& args);

#endif
