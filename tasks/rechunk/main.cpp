#include <unistd.h>
#include <bits/ttl/logger.hpp>
#include <bits/ttl/ttl.hpp>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "fd_endpoint.hpp"
#include "rebuffer.hpp"

using namespace rechunk;

namespace {

constexpr int kExitIo    = 1;
constexpr int kExitUsage = 2;

void usage(const char* prog) {
  std::cerr << "usage: " << prog << " [-d] [-r READ_SIZE] SIZE\n"
            << "  Re-chunks stdin into SIZE-byte blocks on stdout.\n"
            << "  -d            drop a trailing block shorter than SIZE\n"
            << "  -r READ_SIZE  maximum bytes per read (default "
            << FdPump::kDefaultReadSize << ")\n"
            << "  RECHUNK_LOG   log sink URI (default discard://)\n";
}

std::optional<size_t> parseSize(std::string_view s) {
  size_t value    = 0;
  const auto* end = s.data() + s.size();
  auto [ptr, ec]  = std::from_chars(s.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

int main(int argc, char** argv) {
  RebufferOptions options;
  size_t read_size = FdPump::kDefaultReadSize;

  int opt;
  while ((opt = ::getopt(argc, argv, "dr:h")) != -1) {
    switch (opt) {
      case 'd':
        options.discard_incomplete_chunks = true;
        break;
      case 'r': {
        auto v = parseSize(optarg);
        if (!v || *v == 0) {
          std::cerr << argv[0] << ": invalid read size '" << optarg << "'\n";
          return kExitUsage;
        }
        read_size = *v;
        break;
      }
      case 'h':
        usage(argv[0]);
        return 0;
      default:
        usage(argv[0]);
        return kExitUsage;
    }
  }

  if (optind + 1 != argc) {
    usage(argv[0]);
    return kExitUsage;
  }

  auto size = parseSize(argv[optind]);
  if (!size) {
    std::cerr << argv[0] << ": invalid chunk size '" << argv[optind] << "'\n";
    return kExitUsage;
  }

  const char* log_uri = std::getenv("RECHUNK_LOG");
  bits::ttl::Ttl::init(log_uri != nullptr ? log_uri : "discard://");

  // Broken pipes surface as EPIPE from write(2).
  std::signal(SIGPIPE, SIG_IGN);

  int rc = 0;
  {
    FdPump pump(STDIN_FILENO, "stdin");
    try {
      pump.pipeline()
          .addLast<ChunkRebuffer>(*size, options)
          .addLast<FdWriter>(STDOUT_FILENO);
    } catch (const std::invalid_argument& e) {
      std::cerr << argv[0] << ": " << e.what() << '\n';
      bits::ttl::Ttl::shutdown();
      return kExitUsage;
    }

    TTL_LOG(Info) << "Re-chunking stdin into " << *size << " byte blocks";
    rc = pump.run(read_size);
  }

  bits::ttl::Ttl::shutdown();

  if (rc != 0) {
    std::cerr << argv[0] << ": " << std::strerror(-rc) << '\n';
    return kExitIo;
  }
  return 0;
}
