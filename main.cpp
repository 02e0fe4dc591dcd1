#include "extractor.hpp"
#include "parser_options.hpp"
#include "report_writer.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv)
{
  try {
    std::string deckPath;
    bool dumpSlides = false;
    std::string csvOutDir;
    ParserOptions options;

    spdlog::set_level(spdlog::level::warn);

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--slides") {
        dumpSlides = true;
      } else if (arg == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
      } else if (arg.rfind("--csv-out=", 0) == 0) {
        csvOutDir = arg.substr(std::string("--csv-out=").size());
      } else if (arg.rfind("--aliases=", 0) == 0) {
        options.entityAliases = loadEntityAliases(arg.substr(std::string("--aliases=").size()));
      } else if (arg.rfind("--today=", 0) == 0) {
        options.today = arg.substr(std::string("--today=").size());
        if (!isIsoDate(options.today)) {
          std::cerr << "Invalid --today value (expected YYYY-MM-DD): " << options.today << "\n";
          return 2;
        }
      } else if (arg.rfind("--tmp=", 0) == 0) {
        options.tempRoot = arg.substr(std::string("--tmp=").size());
      } else if (deckPath.empty() && arg.rfind("--", 0) != 0) {
        deckPath = arg;
      } else {
        std::cerr << "Unknown argument: " << arg << "\n";
        return 2;
      }
    }

    if (deckPath.empty() || !std::filesystem::exists(deckPath)) {
      if (!deckPath.empty()) std::cerr << "Deck not found: " << deckPath << "\n";
      std::cerr << "Usage: " << argv[0]
                << " [--slides] [--csv-out=dir] [--aliases=file] [--today=YYYY-MM-DD] [--tmp=dir] [--verbose]"
                << " <deck.pptx>\n";
      return 2;
    }

    std::string bytes = readDeckFile(deckPath);

    if (dumpSlides) {
      writeSlidesJson(std::cout, extractDeckSlides(bytes, options));
      return 0;
    }

    DeckParseResult result = parseDeck(bytes, options);
    if (!csvOutDir.empty()) {
      writeReportsAsCsv(result.reports, csvOutDir);
      std::cerr << "Wrote risks.csv and tasks.csv to '" << csvOutDir << "'\n";
    }
    writeReportsJson(std::cout, result);

    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
