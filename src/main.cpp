#include "cache/image_cache.hpp"
#include "codec/header_decoder.hpp"
#include "logger/logger.hpp"
#include "manager/image_manager.hpp"
#include "network/downloader.hpp"
#include <condition_variable>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct ProgramOptions {
  std::vector<std::string> urls;
  std::string directory;
  std::string name_space{"default"};
  std::size_t concurrency{6};
  bool lifo{false};
  bool memory_only{false};
  bool refresh{false};
  bool evict{false};
  bool clear{false};
  std::string log_file{"webimg.log"};
  bool verbose{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -u <url> [-u <url> ...] [options]\n"
            << "Options:\n"
            << "  -u, --url <url>          Image to resolve, may be repeated\n"
            << "  -d, --dir <path>         Cache directory (default: $XDG_CACHE_HOME or ~/.cache)\n"
            << "  -n, --namespace <name>   Cache namespace (default: default)\n"
            << "  -c, --concurrency <n>    Concurrent downloads (default: 6)\n"
            << "      --lifo               Start the most recently queued download first\n"
            << "      --memory-only        Do not write downloads to disk\n"
            << "      --refresh            Revalidate cached images with the server\n"
            << "      --evict              Run the disk eviction sweep before resolving\n"
            << "      --clear              Empty both cache tiers before resolving\n"
            << "  -l, --log <file>         Log file (default: webimg.log)\n"
            << "  -v, --verbose            Debug logging, mirrored to the console\n"
            << "Example: " << program_name << " -u https://example.com/logo.png -c 4\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    // Switches
    if (flag == "--lifo") {
      options.lifo = true;
      continue;
    } else if (flag == "--memory-only") {
      options.memory_only = true;
      continue;
    } else if (flag == "--refresh") {
      options.refresh = true;
      continue;
    } else if (flag == "--evict") {
      options.evict = true;
      continue;
    } else if (flag == "--clear") {
      options.clear = true;
      continue;
    } else if (flag == "-v" || flag == "--verbose") {
      options.verbose = true;
      continue;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-u" || flag == "--url") {
      options.urls.push_back(value);
    } else if (flag == "-d" || flag == "--dir") {
      options.directory = value;
    } else if (flag == "-n" || flag == "--namespace") {
      options.name_space = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-c" || flag == "--concurrency") {
      try {
        options.concurrency = static_cast<std::size_t>(std::stoul(value));
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid concurrency: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
      if (options.concurrency == 0) {
        std::cerr << "Error: Concurrency must be at least 1\n";
        return options;
      }
    } else {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.urls.empty() && !options.evict && !options.clear) {
    std::cerr << "Error: At least one URL is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

void print_result(const std::string& url, const webimg::manager::ResolveResult& result) {
  if (!result.succeeded()) {
    std::cout << url << ": FAILED " << result.error->to_string() << '\n';
    return;
  }
  if (result.error) {
    std::cout << url << ": " << result.error->to_string() << '\n';
    return;
  }

  std::cout << url << ": " << webimg::cache::tier_to_string(result.tier);
  if (result.data) {
    std::cout << ", " << result.data->size() << " bytes";
  } else {
    std::cout << ", not modified";
  }
  if (result.image) {
    std::cout << ", " << webimg::codec::format_to_string(result.image->format)
              << " " << result.image->width << "x" << result.image->height
              << (result.image->animated ? " animated" : "");
  }
  std::cout << '\n';
}

bool run(const ProgramOptions& options) {
  namespace wc = webimg::cache;
  namespace wm = webimg::manager;
  namespace wn = webimg::network;

  auto decoder = std::make_shared<webimg::codec::HeaderDecoder>();

  wc::CacheConfig cache_config;
  cache_config.memory_only = options.memory_only;
  const std::filesystem::path directory = options.directory.empty() ? wc::ImageCache::default_directory()
                                                                    : std::filesystem::path(options.directory);
  auto cache = std::make_shared<wc::ImageCache>(options.name_space, directory, cache_config, decoder);

  wn::DownloaderConfig downloader_config;
  downloader_config.max_concurrent_downloads = options.concurrency;
  downloader_config.execution_order = options.lifo ? wn::ExecutionOrder::LIFO : wn::ExecutionOrder::FIFO;
  auto downloader = std::make_shared<wn::Downloader>(downloader_config, nullptr, decoder);

  // Outlives the manager, whose callback thread drains on destruction
  std::mutex mutex;
  std::condition_variable done;
  std::size_t remaining = options.urls.size();
  bool all_succeeded = true;
  auto manager = std::make_unique<wm::ImageManager>(cache, downloader, wm::ManagerConfig(), decoder);

  if (options.clear) {
    std::promise<void> cleared;
    cache->clear_memory();
    cache->clear_disk([&cleared]() { cleared.set_value(); });
    cleared.get_future().wait();
    std::cout << "Cache cleared\n";
  }

  if (options.evict) {
    std::promise<void> evicted;
    cache->evict_expired([&evicted]() { evicted.set_value(); });
    evicted.get_future().wait();
    std::cout << "Eviction finished, " << cache->disk_count() << " files (" << cache->disk_size()
              << " bytes) on disk\n";
  }

  wm::ResolveOptions resolve_options;
  resolve_options.memory_only = options.memory_only;
  resolve_options.refresh_cached = options.refresh;

  for (const auto& url : options.urls) {
    auto counted = std::make_shared<bool>(false);
    manager->resolve(url, resolve_options, nullptr,
      [&, url, counted](const wm::ResolveResult& result) {
        print_result(url, result);
        if (!result.finished) {
          return;
        }
        std::lock_guard<std::mutex> lock(mutex);
        all_succeeded = all_succeeded && result.succeeded();
        // A refreshed hit can finish a second time with fresh data
        if (!*counted) {
          *counted = true;
          --remaining;
          done.notify_all();
        }
      });
  }

  {
    std::unique_lock<std::mutex> lock(mutex);
    done.wait(lock, [&]() { return remaining == 0; });
  }

  // Revalidations may still be running
  while (manager->is_busy()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  manager.reset();
  // Exit with every queued disk write on disk
  cache->drain();
  return all_succeeded;
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  webimg::logging::init_logging(options.log_file,
                                options.verbose ? webimg::logging::severity_level::debug
                                                : webimg::logging::severity_level::info,
                                options.verbose);

  try {
    return run(options) ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
