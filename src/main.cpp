#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

#include "run.h"

static void print_usage(const char* program) {
  std::printf("Usage: %s [options] [photos_directory]\n\n", program);
  std::printf("  --demo [count]        Show a synthetic collection instead of a directory\n");
  std::printf("  --log-level <level>   trace, debug, info, warning, error, critical or off\n");
  std::printf("  --help                Show this message\n");
}

int main(int argc, char** argv) {
#ifdef _WIN32
  // Set console to UTF-8 mode for proper Unicode display
  SetConsoleOutputCP(CP_UTF8);
  SetConsoleCP(CP_UTF8);
#endif

  RunOptions options;
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
    else if (std::strcmp(arg, "--demo") == 0) {
      options.demo = true;
      if (i + 1 < argc && argv[i + 1][0] != '-') {
        char* end = nullptr;
        long count = std::strtol(argv[i + 1], &end, 10);
        if (end && *end == '\0' && count > 0) {
          options.demo_count = static_cast<int>(count);
          ++i;
        }
      }
    }
    else if (std::strcmp(arg, "--log-level") == 0) {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "--log-level needs a value\n");
        return 1;
      }
      options.log_level = Logger::parse_level(argv[++i], LogLevel::Info);
    }
    else if (arg[0] == '-') {
      std::fprintf(stderr, "Unknown option: %s\n\n", arg);
      print_usage(argv[0]);
      return 1;
    }
    else {
      options.photos_directory = arg;
    }
  }

  return run(options);
}
