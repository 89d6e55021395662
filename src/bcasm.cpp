#include "argparse.h"
#include "asm_config.h"
#include "asm_source.h"
#include "basic_assembler.h"
#include "isa_table.h"
#include "listing.h"
#include "log.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
   BcasmArgs args;
   std::vector<std::string> source_list;
   parseArguments(argc, argv, source_list, args);

   if (source_list.size() != 1) {
      LOG_ERROR("Expected exactly one source file, got " << source_list.size());
      return 1;
   }
   const std::string& path = source_list[0];

   AsmConfig cfg;
   std::string err;
   if (!args.cfgFilePath.empty()) {
      err = read_config(args.cfgFilePath, cfg);
      if (!err.empty()) {
         LOG_ERROR(err);
         return 1;
      }
   }
   err = apply_config_overrides(cfg, args.cfgOverrides);
   if (!err.empty()) {
      LOG_ERROR("Invalid override: " << err);
      return 1;
   }
   if (!args.mriPath.empty()) cfg.mri_table = args.mriPath;
   if (!args.rriPath.empty()) cfg.rri_table = args.rriPath;
   if (!args.ioiPath.empty()) cfg.ioi_table = args.ioiPath;
   if (!args.format.empty() && !parse_listing_format(args.format, cfg.format)) {
      LOG_ERROR("Unknown listing format '" << args.format << "' (expected bin or hex)");
      return 1;
   }
   if (args.symbols) cfg.print_symbols = true;

   InstructionSet isa;
   err = load_instruction_set(cfg.mri_table, cfg.rri_table, cfg.ioi_table, isa);
   if (!err.empty()) {
      LOG_ERROR(err);
      return 1;
   }

   std::string source;
   err = read_source_file(path, source);
   if (!err.empty()) {
      LOG_ERROR(err);
      return 1;
   }

   BasicAssembler assembler(isa, cfg.asm_options());
   AsmResult result = assembler.assemble(tokenize_source(source, cfg.comment_marker));
   if (!result.success) {
      for (const auto& e : result.errors) {
         std::cerr << path << ": " << format_error(e) << std::endl;
      }
      return 1;
   }
   LOG_VERBOSE(path << ": " << result.image.size() << " words, " << result.labels.size()
            << " labels, " << result.warnings.size() << " warnings");

   if (!args.outputPath.empty()) {
      err = save_listing(args.outputPath, result, cfg.format, cfg.print_symbols);
      if (!err.empty()) {
         LOG_ERROR(err);
         return 1;
      }
      return 0;
   }

   write_listing(std::cout, result.image, cfg.format);
   if (cfg.print_symbols) {
      std::cout << "; labels\n";
      write_symbols(std::cout, result.labels, cfg.format);
   }
   return 0;
}
