#include "network/BitgetLedgerClient.h"
#include "network/BitgetSigner.h"
#include "common/AmountFormat.h"
#include "execution/ExternalCallError.h"

#include <cassert>
#include <deque>
#include <functional>
#include <iostream>

using namespace chainshuttle;
using namespace chainshuttle::network;
using chainshuttle::execution::ErrorClass;
using chainshuttle::execution::ExternalCallError;

namespace {

struct RecordedRequest {
    std::string method;
    std::string url;
    std::string body;
    std::map<std::string, std::string> headers;
};

// Answers queued per path, in order; records everything it was sent.
class ScriptedHttpClient : public IHttpClient {
public:
    std::vector<RecordedRequest> requests;

    void enqueue(const std::string& path, int status, const std::string& body) {
        HttpResponse response;
        response.status_code = status;
        response.body = body;
        responses_[path].push_back(response);
    }

    HttpResponse get(const std::string& url, const std::map<std::string, std::string>& headers) override {
        requests.push_back({"GET", url, "", headers});
        return next(url);
    }

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::map<std::string, std::string>& headers) override {
        requests.push_back({"POST", url, body, headers});
        return next(url);
    }

private:
    HttpResponse next(const std::string& url) {
        const auto start = url.find("/api/");
        const auto query = url.find('?');
        const std::string path = url.substr(start, query == std::string::npos ? std::string::npos : query - start);
        auto& queue = responses_[path];
        if (queue.empty()) {
            throw ExternalCallError(ErrorClass::TRANSIENT, "no scripted response for " + path);
        }
        HttpResponse response = queue.front();
        queue.pop_front();
        return response;
    }

    std::map<std::string, std::deque<HttpResponse>> responses_;
};

const AssetInfo kUsdc{"USDC", "0xaf88d065e77c8cc2239327c5edb3a432268e5831", 6};

struct Fixture {
    std::shared_ptr<ScriptedHttpClient> http = std::make_shared<ScriptedHttpClient>();
    std::shared_ptr<BitgetLedgerClient> ledger;

    Fixture() {
        BitgetConfig config;
        config.base_url = "https://bitget.test";
        config.api_key = "key";
        config.api_secret = "test-secret";
        config.passphrase = "pass";
        config.chain_aliases = {{"Arbitrum", "ARBITRUMONE"}};
        auto client = std::make_shared<BitgetHttpClient>(config, http);
        ledger = std::make_shared<BitgetLedgerClient>(client, std::map<std::string, AssetInfo>{{"USDC", kUsdc}});
    }
};

ErrorClass classOfFailure(const std::function<void()>& call) {
    try {
        call();
    } catch (const ExternalCallError& e) {
        return e.errorClass();
    }
    assert(false && "expected ExternalCallError");
    return ErrorClass::TRANSIENT;
}

void testSigner() {
    assert(BitgetSigner::base64Encode("hello") == "aGVsbG8=");
    assert(BitgetSigner::buildQueryString({{"limit", "100"}, {"coin", "USDC"}}) == "coin=USDC&limit=100");
    assert(BitgetSigner::sign("test-secret", "1700000000000", "get",
                              "/api/v2/spot/wallet/withdraw-list?coin=USDC&limit=100") ==
           "eGAHWB+Z79XqjQqvasWwbsvgQhMwYRN7McOk0NbCrSY=");
    assert(BitgetSigner::sign("test-secret", "1700000000000", "POST",
                              "/api/v2/spot/wallet/withdrawal", "{\"coin\":\"USDC\"}") ==
           "CNlfvnUVRUirWXj/0abT/1GZEWROSpk1qYyDqUXvhkY=");
    std::cout << "[TEST] BitgetSigner ok\n";
}

void testWithdraw() {
    Fixture f;
    f.http->enqueue("/api/v2/spot/account/assets", 200,
                    R"({"code":"00000","data":[{"coin":"USDC","available":"2500.25"}]})");
    f.http->enqueue("/api/v2/spot/wallet/withdrawal", 200,
                    R"({"code":"00000","data":{"orderId":"1186","clientOid":"cs-abc"}})");

    const std::string id = f.ledger->withdraw(kUsdc, "Arbitrum", *common::parseUnits("1000.5", 6),
                                              "0x1111111111111111111111111111111111111111", "cs-abc");
    assert(id == "1186");
    assert(f.http->requests.size() == 2);

    const auto& post = f.http->requests.back();
    assert(post.method == "POST");
    assert(post.url == "https://bitget.test/api/v2/spot/wallet/withdrawal");
    const auto body = nlohmann::json::parse(post.body);
    assert(body["coin"] == "USDC");
    assert(body["chain"] == "ARBITRUMONE");
    assert(body["size"] == "1000.5");
    assert(body["transferType"] == "on_chain");
    assert(body["clientOid"] == "cs-abc");
    assert(post.headers.at("ACCESS-KEY") == "key");
    assert(post.headers.at("ACCESS-SIGN") ==
           BitgetSigner::sign("test-secret", post.headers.at("ACCESS-TIMESTAMP"), "POST",
                              "/api/v2/spot/wallet/withdrawal", post.body));
    std::cout << "[TEST] withdraw request ok\n";
}

void testWithdrawFailures() {
    Fixture f;
    f.http->enqueue("/api/v2/spot/account/assets", 200,
                    R"({"code":"00000","data":[{"coin":"USDC","available":"10"}]})");
    assert(classOfFailure([&]() {
        f.ledger->withdraw(kUsdc, "Arbitrum", *common::parseUnits("1000", 6),
                           "0x1111111111111111111111111111111111111111", "cs-1");
    }) == ErrorClass::PERMANENT);
    // nothing was sent to the withdrawal endpoint
    assert(f.http->requests.size() == 1);

    f.http->enqueue("/api/v2/spot/account/assets", 200, R"({"code":"00000","data":[]})");
    f.http->enqueue("/api/v2/spot/wallet/withdrawal", 400,
                    R"({"code":"43012","msg":"Insufficient balance"})");
    assert(classOfFailure([&]() {
        f.ledger->withdraw(kUsdc, "Arbitrum", 1, "0x1111111111111111111111111111111111111111", "cs-2");
    }) == ErrorClass::PERMANENT);

    f.http->enqueue("/api/v2/spot/account/assets", 502, "<html>bad gateway</html>");
    assert(classOfFailure([&]() {
        f.ledger->withdraw(kUsdc, "Arbitrum", 1, "0x1111111111111111111111111111111111111111", "cs-3");
    }) == ErrorClass::TRANSIENT);
    std::cout << "[TEST] withdraw failures classified\n";
}

void testHistoryLookups() {
    Fixture f;
    f.http->enqueue("/api/v2/spot/wallet/withdraw-list", 200, R"({"code":"00000","data":[
        {"orderId":"1186","clientOid":"cs-abc","coin":"USDC","status":"success","size":"1000.5","fee":"-0.5","tradeId":"0xfeed"}
    ]})");
    const auto found = f.ledger->findWithdrawal("cs-abc");
    assert(found.has_value());
    assert(found->external_id == "1186");
    assert(found->status == core::LedgerOperationStatus::SUCCESS);
    assert(found->observed_amount == *common::parseUnits("1000", 6));
    assert(f.http->requests.back().url.find("clientOid=cs-abc") != std::string::npos);

    f.http->enqueue("/api/v2/spot/wallet/withdraw-list", 200, R"({"code":"00000","data":[]})");
    assert(!f.ledger->findWithdrawal("cs-missing").has_value());

    f.http->enqueue("/api/v2/spot/wallet/withdraw-list", 200, R"({"code":"00000","data":[]})");
    const auto unlisted = f.ledger->statusOf("1187");
    assert(unlisted.status == core::LedgerOperationStatus::PENDING);

    f.http->enqueue("/api/v2/spot/wallet/deposit-address", 200,
                    R"({"code":"00000","data":{"coin":"USDC","chain":"ARBITRUMONE","address":"0x2222222222222222222222222222222222222222"}})");
    assert(f.ledger->depositAddressFor(kUsdc, "Arbitrum") == "0x2222222222222222222222222222222222222222");

    f.http->enqueue("/api/v2/spot/wallet/deposit-list", 200, R"({"code":"00000","data":[
        {"orderId":"d-1","coin":"USDC","status":"success","size":"999.5","tradeId":"0xABCDEF"}
    ]})");
    const auto credited = f.ledger->depositStatusOf(kUsdc, "0xabcdef");
    assert(credited.status == core::LedgerOperationStatus::SUCCESS);
    assert(credited.external_id == "d-1");
    assert(credited.observed_amount == *common::parseUnits("999.5", 6));

    // an unknown business code on HTTP 200 is not retried
    f.http->enqueue("/api/v2/spot/wallet/deposit-list", 200, R"({"code":"40999","msg":"odd"})");
    assert(classOfFailure([&]() { f.ledger->depositStatusOf(kUsdc, "0x1"); }) == ErrorClass::PERMANENT);
    std::cout << "[TEST] history lookups ok\n";
}

} // namespace

int main() {
    testSigner();
    testWithdraw();
    testWithdrawFailures();
    testHistoryLookups();

    std::cout << "[TEST] BitgetLedgerClient PASSED\n";
    return 0;
}
