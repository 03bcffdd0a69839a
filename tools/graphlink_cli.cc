#include <iostream>
#include <stdexcept>
#include <string>

#include "../client/client.hh"
#include "../client/transaction.hh"
#include "../common/log.h"

using namespace graphlink;

namespace {

int usage() {
    std::cerr << "usage: graphlink_cli version\n"
              << "       graphlink_cli query <query>\n"
              << "       graphlink_cli alter <schema>\n"
              << "       graphlink_cli mutate <set-json>\n"
              << "endpoints: GRAPHLINK_ENDPOINTS=host:port[,host:port...]" << std::endl;
    return 2;
}

template<typename T>
int report_failure(const Result<T>& result) {
    std::cerr << "error: " << result.describe() << std::endl;
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) return usage();
    const std::string command = argv[1];

    std::unique_ptr<Client> client;
    try {
        client = Client::connect(ClientConfig::from_env());
    } catch (const std::invalid_argument& e) {
        GRAPHLINK_LOG_ERROR("Invalid configuration: %s", e.what());
        return 2;
    }

    if (command == "version") {
        auto version = client->check_version();
        if (version.is_failed()) return report_failure(version);
        std::cout << version.value() << std::endl;
        return 0;
    }

    if (argc < 3) return usage();
    const std::string argument = argv[2];

    if (command == "query") {
        auto txn = client->new_read_only_transaction();
        auto response = txn->query(argument);
        if (response.is_failed()) return report_failure(response);
        std::cout << response.value().json() << std::endl;
        return 0;
    }

    if (command == "alter") {
        protocol::Operation operation;
        operation.set_schema(argument);
        auto altered = client->alter(operation);
        if (altered.is_failed()) return report_failure(altered);
        std::cout << "schema updated" << std::endl;
        return 0;
    }

    if (command == "mutate") {
        auto txn = client->new_transaction();
        auto response = txn->mutate(argument, "", true);
        if (response.is_failed()) return report_failure(response);
        for (const auto& uid : response.value().uids()) {
            std::cout << uid.first << " => " << uid.second << std::endl;
        }
        return 0;
    }

    return usage();
}
