#include <bta/active_completion_queue.hpp>
#include <bta/log.hpp>
#include <bta/status_code.hpp>
#include <bta/table_admin.hpp>

#include <cstdlib>
#include <iostream>

namespace {
void usage(char const* argv0) {
  std::cerr << "Usage: " << argv0 << " <endpoint> <project> <instance> <command> [args]\n"
            << "Commands:\n"
            << "  list\n"
            << "  create <table> [family[:max_versions]...]\n"
            << "  get <table>\n"
            << "  delete <table>\n"
            << "  drop-rows <table> [row-key-prefix]\n"
            << "Environment:\n"
            << "  BTA_LOG_LEVEL        the minimum severity logged, e.g. debug\n"
            << "  BTA_RETRYABLE_CODES  the status codes retried, e.g. UNAVAILABLE,ABORTED\n"
            << "  BTA_MAX_ATTEMPTS     the maximum number of attempts for each call\n";
}

bta::retry_options retry_from_environment() {
  bta::retry_options retry;
  if (char const* codes = std::getenv("BTA_RETRYABLE_CODES")) {
    retry = retry.with_retryable_codes(bta::parse_status_code_list(codes));
  }
  if (char const* attempts = std::getenv("BTA_MAX_ATTEMPTS")) {
    retry = retry.with_max_attempts(std::stoi(attempts));
  }
  return retry;
}

/// Parse "name" or "name:max_versions".
std::pair<std::string, int> parse_family(std::string const& arg) {
  auto pos = arg.find(':');
  if (pos == std::string::npos) {
    return {arg, 0};
  }
  return {arg.substr(0, pos), std::stoi(arg.substr(pos + 1))};
}

void print(bta::table_info const& info) {
  std::cout << info.table_id << "\n";
  for (auto const& family : info.column_families) {
    std::cout << "  " << family << "\n";
  }
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  if (argc < 5) {
    usage(argv[0]);
    return 1;
  }
  std::string const endpoint = argv[1];
  std::string const command = argv[4];
  std::vector<std::string> args(argv + 5, argv + argc);

  bta::log::instance().add_sink(bta::make_stderr_log_sink());
  if (char const* level = std::getenv("BTA_LOG_LEVEL")) {
    bta::log::instance().min_severity(bta::parse_severity(level));
  }

  auto channel = grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials());
  auto stub = std::make_shared<grpc::GenericStub>(channel);
  bta::active_completion_queue queue;
  bta::table_admin<> admin(queue.queue(), stub, bta::table_admin_options(argv[2], argv[3], retry_from_environment()));

  if (command == "list" and args.empty()) {
    for (auto const& id : admin.list_tables()) {
      std::cout << id << "\n";
    }
  } else if (command == "create" and not args.empty()) {
    bta::table_spec spec{args[0], {}};
    for (auto i = args.begin() + 1; i != args.end(); ++i) {
      spec.column_families.insert(parse_family(*i));
    }
    print(admin.create_table(spec));
  } else if (command == "get" and args.size() == 1) {
    print(admin.get_table(args[0]));
  } else if (command == "delete" and args.size() == 1) {
    admin.delete_table(args[0]);
    std::cout << "deleted " << args[0] << "\n";
  } else if (command == "drop-rows" and (args.size() == 1 or args.size() == 2)) {
    admin.drop_row_range(args[0], args.size() == 2 ? args[1] : std::string());
    std::cout << "dropped rows in " << args[0] << "\n";
  } else {
    usage(argv[0]);
    return 1;
  }
  return 0;
} catch (bta::rpc_error const& ex) {
  std::cerr << "rpc_error raised: " << ex.what() << std::endl;
  return 2;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
