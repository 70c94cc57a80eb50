#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "directoryjanitor.hpp"
#include "logger.hpp"
#include "pathresolver.hpp"
#include "safefileops.hpp"
#include "storageconfig.hpp"
#include "utils.hpp"

/**
 * @class Application
 * @brief Command line front end for the SafeStore storage layer
 *
 * Wires a StorageConfig, a ProtectionManager and a PathResolver together and
 * dispatches one command per invocation. Output goes to stdout, diagnostics
 * go through the Logger (stderr and the optional log file).
 *
 * Exit codes
 *  - 0: success
 *  - 1: the operation failed (fully or partially)
 *  - 2: usage error
 *  - 3: a storage root could not be provided
 */
class Application {
public:
  Application(StorageConfig config, ProtectionManager protection)
      : m_resolver(std::move(config), protection), m_ops(protection) {}

  int run(const std::string &command, const std::vector<std::string> &args) {
    try {
      if (command == "roots")
        return showRoots();
      if (command == "clean-temp")
        return cleanTemp();
      if (command == "clear" && args.size() == 1)
        return clear(args[0]);
      if (command == "size" && args.size() == 1)
        return size(args[0]);
      if (command == "protect")
        return protect(args);
      if (command == "protection" && args.size() == 1)
        return showProtection(args[0]);
      if (command == "move" && args.size() == 2)
        return move(args[0], args[1]);
      if (command == "retire" && args.size() == 1)
        return retire(args[0]);
    } catch (const StorageException &e) {
      std::cerr << e.what() << std::endl;
      return 3;
    }

    printUsage();
    return 2;
  }

  static void printUsage() {
    std::cout
        << "safestore [-c config] [-v] [-a app-id] [-g group-id] [-t temp-base] <command>\n"
        << "  roots                      print every storage root\n"
        << "  clean-temp                 purge stale temporary directories\n"
        << "  clear <dir>                delete the contents of a directory\n"
        << "  size <path|file-url>       print size or \"absent\"\n"
        << "  protect [-r] [-p class] <path>\n"
        << "  protection <path>          print the stored class\n"
        << "  move <from> <to>\n"
        << "  retire <path>              rename using a random extension\n";
  }

private:
  int showRoots() {
    const StorageRoot roots[] = {StorageRoot::Documents, StorageRoot::Library,
                                 StorageRoot::Caches,
                                 StorageRoot::TemporaryAfterFirstAuth,
                                 StorageRoot::TemporaryLocked};
    for (auto root : roots) {
      std::cout << PathResolver::rootName(root) << ": "
                << m_resolver.resolve(root) << std::endl;
    }

    if (m_resolver.config().group_id.empty()) {
      std::cout << PathResolver::rootName(StorageRoot::SharedData)
                << ": (no group id configured)" << std::endl;
    } else {
      std::cout << PathResolver::rootName(StorageRoot::SharedData) << ": "
                << m_resolver.appSharedDataDirectoryPath() << std::endl;
    }
    return 0;
  }

  int cleanTemp() {
    auto report = DirectoryJanitor::clearOldTemporaryDirectories(m_resolver);
    std::cout << "Purged " << report.removed << " stale directories";
    if (report.failed > 0)
      std::cout << ", " << report.failed << " failures";
    std::cout << std::endl;
    return report.fullySucceeded() ? 0 : 1;
  }

  int clear(const std::string &dir) {
    auto report = DirectoryJanitor::deleteContentsOfDirectory(dir);
    std::cout << "Removed " << report.removed << " entries";
    if (report.failed > 0)
      std::cout << ", " << report.failed << " failures";
    std::cout << std::endl;
    return report.fullySucceeded() ? 0 : 1;
  }

  int size(const std::string &target) {
    auto bytes = target.rfind("file:", 0) == 0
                     ? SafeFileOps::fileSizeOfUrl(target)
                     : SafeFileOps::fileSizeOfPath(target);
    if (!bytes) {
      std::cout << "absent" << std::endl;
      return 1;
    }
    std::cout << *bytes << " (" << formatBytes(*bytes) << ")" << std::endl;
    return 0;
  }

  int protect(const std::vector<std::string> &args) {
    bool recursive = false;
    std::optional<ProtectionClass> cls;
    std::string path;

    for (size_t i = 0; i < args.size(); ++i) {
      if (args[i] == "-r") {
        recursive = true;
      } else if (args[i] == "-p" && i + 1 < args.size()) {
        cls = protectionClassFromName(args[++i]);
        if (!cls) {
          std::cerr << "Unknown protection class: " << args[i] << std::endl;
          return 2;
        }
      } else {
        path = args[i];
      }
    }
    if (path.empty() || (recursive && cls)) {
      printUsage();
      return 2;
    }

    const ProtectionManager &protection = m_resolver.protection();
    if (recursive) {
      auto report = protection.protectRecursive(path);
      std::cout << "Visited " << report.attempted << " entries, "
                << report.failed << " failures" << std::endl;
      return report.fullySucceeded() ? 0 : 1;
    }

    auto error = cls ? protection.protect(path, *cls) : protection.protect(path);
    if (error) {
      std::cerr << error->message() << std::endl;
      return 1;
    }
    return 0;
  }

  int showProtection(const std::string &path) {
    auto cls = m_resolver.protection().protectionClassOf(path);
    std::cout << (cls ? protectionClassName(*cls) : "unknown") << std::endl;
    return 0;
  }

  int move(const std::string &from, const std::string &to) {
    if (auto error = m_ops.moveFilePath(from, to)) {
      std::cerr << error->message() << std::endl;
      return 1;
    }
    return 0;
  }

  int retire(const std::string &path) {
    std::string new_path;
    if (auto error = m_ops.renameFilePathUsingRandomExtension(path, &new_path)) {
      std::cerr << error->message() << std::endl;
      return 1;
    }
    std::cout << new_path << std::endl;
    return 0;
  }

  PathResolver m_resolver;
  SafeFileOps m_ops;
};

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string app_id;
  std::string group_id;
  std::string temp_base;
  bool verbose = false;
  std::string command;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!command.empty()) {
      args.push_back(arg);
      continue;
    }

    if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      config_path = argv[++i];
    } else if ((arg == "-a" || arg == "--app-id") && i + 1 < argc) {
      app_id = argv[++i];
    } else if ((arg == "-g" || arg == "--group-id") && i + 1 < argc) {
      group_id = argv[++i];
    } else if ((arg == "-t" || arg == "--temp-base") && i + 1 < argc) {
      temp_base = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      Application::printUsage();
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << std::endl;
      Application::printUsage();
      return 2;
    } else {
      command = arg;
    }
  }

  if (command.empty()) {
    Application::printUsage();
    return 2;
  }

  StorageConfig config;
  if (config_path.empty()) {
    config = StorageConfig::loadDefault();
  } else {
    try {
      config = StorageConfig::fromFile(config_path);
    } catch (const std::exception &e) {
      std::cerr << e.what() << std::endl;
      return 2;
    }
  }
  config.mergeWithCli(app_id, group_id, temp_base, verbose);

  if (!Logger::getInstance().init(config.verbose, config.log_file)) {
    LOG_WARN("Continuing without log file");
  }

  Application app(config, ProtectionManager::createDefault());
  return app.run(command, args);
}
