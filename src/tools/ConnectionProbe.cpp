#include "common/Config.h"
#include "common/Errors.h"
#include "exchange/BybitGateway.h"
#include "network/BybitHttpClient.h"

#include <iostream>
#include <memory>

// 설정된 키가 testnet / production 중 어디에서 인증되는지 확인
int main() {
    using namespace spotpilot;

    auto& cfg = Config::getInstance();
    try {
        cfg.load("config/config.json");
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    if (cfg.getApiKey().empty() || cfg.getApiSecret().empty()) {
        std::cerr << "Missing BYBIT_API_KEY / BYBIT_API_SECRET\n";
        return 1;
    }

    const network::ApiCredentials credentials{cfg.getApiKey(), cfg.getApiSecret()};
    const ExchangeEnvironment targets[] = {ExchangeEnvironment::TESTNET, ExchangeEnvironment::PRODUCTION};

    int authenticated = 0;
    for (const auto env : targets) {
        auto gateway_config = cfg.getGatewayConfig();
        gateway_config.environment = env;
        gateway_config.read_policy = execution::RetryPolicy::noRetry();

        const std::string base_url = exchange::restBaseUrl(env);
        auto client = std::make_shared<network::BybitHttpClient>(
            credentials, base_url, gateway_config.timeout_seconds, gateway_config.recv_window_ms);
        exchange::BybitGateway gateway(client, gateway_config);

        std::cout << "[" << toString(env) << "] " << base_url << " ... ";
        try {
            const auto balance = gateway.getWalletBalance();
            std::cout << "OK (account type " << gateway.resolvedAccountType()
                      << ", " << balance.coins.size() << " coin(s))\n";
            ++authenticated;
        } catch (const AuthError& e) {
            std::cout << "AUTH FAILED: " << e.what() << "\n";
        } catch (const TradingError& e) {
            std::cout << "ERROR: " << e.what() << "\n";
        }
    }

    return authenticated > 0 ? 0 : 2;
}
