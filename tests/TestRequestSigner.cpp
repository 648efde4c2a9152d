#include "network/RequestSigner.h"

#include <cassert>
#include <iostream>

using spotpilot::network::RequestSigner;

int main() {
    // RFC 4231 test case 2
    assert(RequestSigner::hmacSha256Hex("Jefe", "what do ya want for nothing?") ==
           "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

    // 서명 대상 = timestamp + key + recvWindow + payload
    const std::string payload = "accountType=UNIFIED&coin=USDT";
    assert(RequestSigner::sign("secret", 1700000000000LL, "key", 5000, payload) ==
           RequestSigner::hmacSha256Hex("secret", "1700000000000key5000" + payload));

    // 정렬된 query string
    assert(RequestSigner::buildQueryString({{"symbol", "BTCUSDT"}, {"category", "spot"}, {"limit", "50"}}) ==
           "category=spot&limit=50&symbol=BTCUSDT");
    assert(RequestSigner::buildQueryString({}).empty());

    const auto a = RequestSigner::generateOrderLinkId();
    const auto b = RequestSigner::generateOrderLinkId();
    assert(a.size() == 34);
    assert(a.rfind("sp", 0) == 0);
    assert(a != b);

    std::cout << "[TEST] RequestSigner PASSED\n";
    return 0;
}
