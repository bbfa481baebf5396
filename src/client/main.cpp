/**
 * @file main.cpp
 * @brief 券商客户端控制台入口
 *
 * 启动流程：
 * 1. 解析命令行参数，加载配置文件
 * 2. 创建 BrokerClient 并注册推送回调
 * 3. 连接、订阅配置中的合约
 * 4. 进入控制台命令循环
 */

#include "base/config.hpp"
#include "base/logger.hpp"
#include "client/broker_client.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  -c, --config <path>   Path to ironlink.ini\n"
              << "  -u, --url <url>       Broker endpoint (overrides config)\n"
              << "  -v, --verbose         Enable debug logging\n"
              << "  --help                Show this help message\n";
}

void printCommands() {
    std::cout << "Commands:\n"
              << "  sub <symbol>                    subscribe market data\n"
              << "  unsub <symbol>                  unsubscribe market data\n"
              << "  buy <symbol> <qty> [price]      market order, or limit when price given\n"
              << "  sell <symbol> <qty> [price]\n"
              << "  cancel <order_id>\n"
              << "  positions | account | stats\n"
              << "  quit\n";
}

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

void printOutcome(const ironlink::RequestOutcome& outcome) {
    std::cout << ironlink::to_string(outcome.status);
    if (!outcome.message.empty()) {
        std::cout << ": " << outcome.message;
    }
    if (outcome.status == ironlink::RequestStatus::OK && !outcome.response.data().empty()) {
        std::cout << "\n" << outcome.response.data().dump(2);
    }
    std::cout << std::endl;
}

void printStats(const ironlink::ConnectionStats& stats) {
    std::cout << "state:              " << ironlink::to_string(stats.state) << "\n"
              << "connected:          " << (stats.connected ? "yes" : "no") << "\n"
              << "reconnect_attempts: " << stats.reconnect_attempts << "\n"
              << "pending_requests:   " << stats.pending_request_count;
    for (const auto& id : stats.pending_request_ids) {
        std::cout << " " << id;
    }
    std::cout << "\n"
              << "subscriptions:      " << stats.active_subscription_count;
    for (const auto& symbol : stats.subscriptions) {
        std::cout << " " << symbol;
    }
    std::cout << std::endl;
}

bool submitOrder(ironlink::BrokerClient& client, ironlink::Side side, const std::vector<std::string>& words) {
    if (words.size() < 3) {
        return false;
    }
    ironlink::OrderSpec order;
    order.symbol = words[1];
    order.side = side;
    order.quantity = std::stoll(words[2]);
    if (words.size() >= 4) {
        order.type = ironlink::OrderType::LIMIT;
        order.price = std::stod(words[3]);
    }
    printOutcome(client.place_order(order));
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // 忽略 SIGPIPE
    signal(SIGPIPE, SIG_IGN);

    std::string configPath = "ironlink.ini";
    std::string url;
    bool verbose = false;

    // 解析命令行参数
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "-u" || arg == "--url") && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto& config = ironlink::Config::instance();
    if (std::filesystem::exists(configPath)) {
        config.load(configPath);
    } else {
        LOG_WARN() << "Config file " << configPath << " not found, using defaults";
    }
    if (verbose || config.get("client", "log_level") == "debug") {
        ironlink::Logger::instance().set_level(ironlink::LogLevel::DEBUG);
    }

    try {
        ironlink::ClientOptions options = ironlink::ClientOptions::from_config(config);
        if (!url.empty()) {
            options.url = url;
        }

        ironlink::BrokerClient client(options);

        client.on_market_data([](const ironlink::InboundEvent& event) {
            LOG() << "[MarketData] " << event.data.dump();
        });
        client.on_order_update([](const ironlink::InboundEvent& event) {
            LOG() << "[OrderUpdate] " << event.data.dump();
        });
        client.on_position_update([](const ironlink::InboundEvent& event) {
            LOG() << "[PositionUpdate] " << event.data.dump();
        });
        client.on_state_change([](ironlink::ConnectionState state, const std::string& reason) {
            if (state == ironlink::ConnectionState::FAILED) {
                std::cerr << "Broker connection failed: " << reason << std::endl;
            }
        });

        LOG() << "Connecting to " << options.url << "...";
        if (!client.connect()) {
            std::cerr << "Unable to connect to " << options.url << std::endl;
            return 1;
        }

        for (const auto& symbol : config.get_list("client", "symbols", "MES")) {
            client.subscribe(symbol);
        }

        printCommands();
        std::string line;
        while (std::cout << "> " << std::flush && std::getline(std::cin, line)) {
            const auto words = splitWords(line);
            if (words.empty()) {
                continue;
            }
            const std::string& cmd = words[0];

            bool understood = true;
            try {
                if (cmd == "quit" || cmd == "exit") {
                    break;
                } else if (cmd == "sub" && words.size() == 2) {
                    printOutcome(client.subscribe(words[1]));
                } else if (cmd == "unsub" && words.size() == 2) {
                    printOutcome(client.unsubscribe(words[1]));
                } else if (cmd == "buy") {
                    understood = submitOrder(client, ironlink::Side::BUY, words);
                } else if (cmd == "sell") {
                    understood = submitOrder(client, ironlink::Side::SELL, words);
                } else if (cmd == "cancel" && words.size() == 2) {
                    printOutcome(client.cancel_order(words[1]));
                } else if (cmd == "positions") {
                    printOutcome(client.query_positions());
                } else if (cmd == "account") {
                    printOutcome(client.query_account_info());
                } else if (cmd == "stats") {
                    printStats(client.get_connection_stats());
                } else {
                    understood = false;
                }
            } catch (const std::invalid_argument& e) {
                std::cerr << "Invalid number: " << e.what() << std::endl;
            } catch (const std::out_of_range& e) {
                std::cerr << "Number out of range: " << e.what() << std::endl;
            }
            if (!understood) {
                printCommands();
            }
        }

        client.disconnect();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
