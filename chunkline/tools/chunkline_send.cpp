#include <getopt.h>

#include <bits/ttl/ttl.hpp>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <chunkline/transfer/dispatcher.hpp>
#include <chunkline/transport/event_watcher/event_watcher.hpp>
#include <chunkline/transport/http/http_client.hpp>
#include <chunkline/transport/http/url.hpp>

namespace chunkline {
namespace {

const struct option kLongOptions[] = {
    {"url", required_argument, nullptr, 'u'},
    {"token", required_argument, nullptr, 't'},
    {"file", required_argument, nullptr, 'f'},
    {"binary", no_argument, nullptr, 'b'},
    {"mime", required_argument, nullptr, 'm'},
    {"chunk", required_argument, nullptr, 'c'},
    {"server-config", no_argument, nullptr, 's'},
    {"api-base", required_argument, nullptr, 'a'},
    {"timeout", required_argument, nullptr, 'T'},
    {"output", required_argument, nullptr, 'o'},
    {"verbose", no_argument, nullptr, 'v'},
    {},  // terminator
};

// Leading ':' makes getopt report a missing argument as ':'.
const char* kShortOptions = ":u:t:f:bm:c:sa:T:o:v";

constexpr int kExitOk     = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage  = 2;

void usage() {
  std::cerr << "Usage: chunkline_send -u URL -t TOKEN [flags]\n"
            << "Required flags:\n"
            << "  -u/--url            Destination, http://host[:port]/path\n"
            << "  -t/--token          Bearer token (default: $CHUNKLINE_TOKEN)\n"
            << "\n"
            << "Optional flags:\n"
            << "  -f/--file           Input file, or - for stdin (default: -)\n"
            << "  -b/--binary         Send the file as raw binary content\n"
            << "                      (default: the file is a JSON request)\n"
            << "  -m/--mime           MIME type of binary content\n"
            << "  -c/--chunk          Maximum payload size in bytes\n"
            << "  -s/--server-config  Read MAX_PAYLOAD_SIZE from "
            << "<api-base>" << transfer::kServerConfigRoute << " first\n"
            << "  -a/--api-base       Path prefix of the API (default: none)\n"
            << "  -T/--timeout        Per-request timeout in ms (default: "
            << http::HttpClient::kDefaultTimeout.count() << ")\n"
            << "  -o/--output         Write the response body to a file\n"
            << "                      (default: stdout)\n"
            << "  -v/--verbose        Log to stdout; use -o to keep the\n"
            << "                      response body apart from the log\n";
}

struct Args {
  std::string url;
  std::string token;
  std::string input_path = "-";
  bool binary            = false;
  std::string mime       = "application/octet-stream";
  std::optional<size_t> chunk;
  bool server_config = false;
  std::string api_base;
  std::chrono::milliseconds timeout = http::HttpClient::kDefaultTimeout;
  std::string output_path;
  bool verbose = false;
};

std::optional<size_t> parseNumber(std::string_view text) {
  size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<Args> parseArgs(int argc, char* argv[]) {
  Args args;
  if (const char* token = std::getenv("CHUNKLINE_TOKEN")) {
    args.token = token;
  }

  while (true) {
    const int current_optind = optind;
    const int c = getopt_long(argc, argv, kShortOptions, kLongOptions, nullptr);
    if (c == -1) {
      break;
    }

    switch (c) {
      case 'u':
        args.url = optarg;
        break;
      case 't':
        args.token = optarg;
        break;
      case 'f':
        args.input_path = optarg;
        break;
      case 'b':
        args.binary = true;
        break;
      case 'm':
        args.mime = optarg;
        break;
      case 'c': {
        auto chunk = parseNumber(optarg);
        if (!chunk || *chunk == 0) {
          std::cerr << "Invalid chunk size: " << optarg << "\n";
          return std::nullopt;
        }
        args.chunk = chunk;
        break;
      }
      case 's':
        args.server_config = true;
        break;
      case 'a':
        args.api_base = optarg;
        break;
      case 'T': {
        auto ms = parseNumber(optarg);
        if (!ms || *ms == 0) {
          std::cerr << "Invalid timeout: " << optarg << "\n";
          return std::nullopt;
        }
        args.timeout = std::chrono::milliseconds(*ms);
        break;
      }
      case 'o':
        args.output_path = optarg;
        break;
      case 'v':
        args.verbose = true;
        break;
      case '?':
        if (optopt) {
          std::cerr << "Invalid flag: -" << static_cast<char>(optopt) << "\n";
        } else {
          std::cerr << "Invalid flag: " << argv[current_optind] << "\n";
        }
        usage();
        return std::nullopt;
      case ':':
        std::cerr << "Missing argument to " << argv[current_optind] << "\n";
        return std::nullopt;
    }
  }

  if (args.url.empty()) {
    std::cerr << "Missing required flag: -u/--url\n";
    usage();
    return std::nullopt;
  }
  if (args.token.empty()) {
    std::cerr << "Missing required flag: -t/--token\n";
    usage();
    return std::nullopt;
  }
  return args;
}

std::optional<std::string> readInput(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "Cannot open " << path << "\n";
    return std::nullopt;
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

std::optional<transfer::Payload> loadPayload(const Args& args) {
  auto content = readInput(args.input_path);
  if (!content.has_value()) {
    return std::nullopt;
  }
  if (args.binary) {
    return transfer::Binary{
        .bytes     = transfer::Bytes(content->begin(), content->end()),
        .mime_hint = args.mime,
    };
  }
  auto value = nlohmann::json::parse(*content, nullptr, /*allow_exceptions=*/false);
  if (value.is_discarded()) {
    std::cerr << args.input_path << " is not valid JSON (use -b for binary)\n";
    return std::nullopt;
  }
  return transfer::Structured{std::move(value)};
}

// Response body to path, or to stdout when path is empty.
bool writeOutput(const std::string& path, const std::string& body) {
  if (path.empty()) {
    std::cout << body;
    if (!body.empty() && body.back() != '\n') {
      std::cout << "\n";
    }
    std::cout.flush();
    return true;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << body;
  out.close();
  if (!out) {
    std::cerr << "Cannot write " << path << "\n";
    return false;
  }
  return true;
}

int run(const Args& args) {
  const auto url = http::parseUrl(args.url);
  if (!url.has_value()) {
    std::cerr << "Unsupported URL: " << args.url << "\n";
    return kExitUsage;
  }
  const auto ip = http::resolveIPv4(url->host);
  if (!ip.has_value()) {
    std::cerr << "Cannot resolve " << url->host << "\n";
    return kExitFailed;
  }

  auto config = transfer::configFromEnvironment();
  if (!config) {
    std::cerr << config.error().describe() << "\n";
    return kExitUsage;
  }
  if (args.chunk.has_value()) {
    config->max_payload_size = *args.chunk;
  }

  auto payload = loadPayload(args);
  if (!payload.has_value()) {
    return kExitUsage;
  }

  io::EventWatcher ew;
  http::HttpClient client(url->hostHeader(), *ip + ":" + std::to_string(url->port),
                          ew, args.timeout);

  std::unique_ptr<transfer::Dispatcher> dispatcher;
  bool done     = false;
  int exit_code = kExitFailed;

  auto onCompleted = [&](http::HttpResponse response) {
    done = true;
    if (!writeOutput(args.output_path, response.body)) {
      exit_code = kExitFailed;
      return;
    }
    exit_code = kExitOk;
  };
  auto onFailure = [&](transfer::TransferError err) {
    std::cerr << err.describe() << "\n";
    exit_code = kExitFailed;
    done      = true;
  };

  auto dispatch = [&](transfer::TransferConfig effective) {
    dispatcher = std::make_unique<transfer::Dispatcher>(
        client, std::move(effective),
        [&ew](std::chrono::milliseconds delay, F<void()> cb) {
          ew.runAfter(delay, std::move(cb));
        });
    dispatcher->send(url->target, args.token, std::move(*payload), onCompleted,
                     onFailure);
  };

  if (args.server_config) {
    transfer::fetchServerConfig(
        client, http::joinPath(args.api_base, transfer::kServerConfigRoute),
        args.token, *config,
        [&](std::expected<transfer::TransferConfig, transfer::TransferError> fetched) {
          if (!fetched) {
            onFailure(std::move(fetched.error()));
            return;
          }
          if (args.chunk.has_value()) {
            fetched->max_payload_size = *args.chunk;
          }
          dispatch(std::move(*fetched));
        });
  } else {
    dispatch(std::move(*config));
  }

  while (!done) {
    ew.loop(100);
  }
  return exit_code;
}

}  // namespace
}  // namespace chunkline

int main(int argc, char* argv[]) {
  auto args = chunkline::parseArgs(argc, argv);
  if (!args.has_value()) {
    return chunkline::kExitUsage;
  }

  bits::ttl::Ttl::init(args->verbose ? "stdout://" : "discard://");
  const int code = chunkline::run(*args);
  bits::ttl::Ttl::shutdown();
  return code;
}
