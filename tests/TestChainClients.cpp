#include "network/EvmRpcChainClient.h"
#include "network/OdosQuoteSource.h"
#include "network/EvmAbi.h"
#include "common/AmountFormat.h"
#include "fakes/FakeClients.h"

#include <cassert>
#include <deque>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace chainshuttle;
using namespace chainshuttle::network;
using chainshuttle::execution::ErrorClass;
using chainshuttle::execution::ExternalCallError;

namespace {

const std::string kWallet = "0x1111111111111111111111111111111111111111";
const std::string kRouter = "0x3333333333333333333333333333333333333333";
const AssetInfo kUsdc{"USDC", "0xaf88d065e77c8cc2239327c5edb3a432268e5831", 6};
const AssetInfo kEth{"ETH", "", 18};

// JSON-RPC node and signer: replies queued per method, requests recorded.
class ScriptedRpc : public IHttpClient {
public:
    struct Call {
        std::string url;
        std::string method;
        nlohmann::json params;
    };
    std::vector<Call> calls;

    void result(const std::string& method, nlohmann::json value) {
        replies_[method].push_back({{"jsonrpc", "2.0"}, {"id", 1}, {"result", std::move(value)}});
    }

    void error(const std::string& method, int code, const std::string& message) {
        replies_[method].push_back({{"jsonrpc", "2.0"}, {"id", 1},
                                    {"error", {{"code", code}, {"message", message}}}});
    }

    HttpResponse get(const std::string&, const std::map<std::string, std::string>&) override {
        throw ExternalCallError(ErrorClass::PERMANENT, "GET is not JSON-RPC");
    }

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::map<std::string, std::string>&) override {
        const auto request = nlohmann::json::parse(body);
        const std::string method = request["method"];
        calls.push_back({url, method, request["params"]});

        auto& queue = replies_[method];
        if (queue.empty()) {
            throw ExternalCallError(ErrorClass::TRANSIENT, "no scripted reply for " + method);
        }
        HttpResponse response;
        response.status_code = 200;
        response.body = queue.front().dump();
        queue.pop_front();
        return response;
    }

    const Call& last(const std::string& method) const {
        for (auto it = calls.rbegin(); it != calls.rend(); ++it) {
            if (it->method == method) {
                return *it;
            }
        }
        throw std::out_of_range("no call to " + method);
    }

private:
    std::map<std::string, std::deque<nlohmann::json>> replies_;
};

// REST endpoints keyed by path.
class ScriptedRest : public IHttpClient {
public:
    std::map<std::string, nlohmann::json> bodies;

    void reply(const std::string& path, int status, const std::string& body) {
        HttpResponse response;
        response.status_code = status;
        response.body = body;
        replies_[path].push_back(response);
    }

    HttpResponse get(const std::string&, const std::map<std::string, std::string>&) override {
        throw ExternalCallError(ErrorClass::PERMANENT, "unexpected GET");
    }

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::map<std::string, std::string>&) override {
        const std::string path = url.substr(url.find("/sor/"));
        bodies[path] = nlohmann::json::parse(body);
        auto& queue = replies_[path];
        if (queue.empty()) {
            throw ExternalCallError(ErrorClass::TRANSIENT, "no scripted reply for " + path);
        }
        HttpResponse response = queue.front();
        queue.pop_front();
        return response;
    }

private:
    std::map<std::string, std::deque<HttpResponse>> replies_;
};

ChainConfig chainConfig() {
    ChainConfig config;
    config.rpc_url = "http://node.test";
    config.signer_url = "http://signer.test";
    config.chain_id = 42161;
    config.wallet_address = kWallet;
    config.gas_price_multiplier = 1.0;
    config.gas_limit_multiplier = 1.2;
    config.rate_limit_per_second = 1000;
    return config;
}

nlohmann::json transferLog(const std::string& token, const std::string& to, const Amount& value) {
    nlohmann::json log;
    log["address"] = token;
    log["topics"] = nlohmann::json::array({evm::kTransferTopic, evm::addressTopic(kRouter), evm::addressTopic(to)});
    log["data"] = "0x" + common::toAbiWord(value);
    return log;
}

void testOdosQuote() {
    auto rest = std::make_shared<ScriptedRest>();
    auto clock = std::make_shared<testing::FakeClock>(1700000000000LL);
    OdosConfig config;
    config.base_url = "https://odos.test";
    config.quote_ttl_ms = 30000;
    config.rate_limit_per_second = 100;
    OdosQuoteSource odos(config, 42161, rest, clock);

    rest->reply("/sor/quote/v2", 200, R"({"pathId":"p-1","outAmounts":["320000000000000000"],"priceImpact":0.02})");
    rest->reply("/sor/assemble", 200, nlohmann::json({
        {"transaction", {{"to", kRouter}, {"data", "0x83bd37f90001"}, {"value", "0"}}},
        {"outputTokens", {{{"tokenAddress", evm::kZeroAddress}, {"amount", "319500000000000000"}}}},
    }).dump());

    const auto plan = odos.quote(kUsdc, kEth, *common::parseUnits("1000", 6), kWallet);
    assert(plan.path_id == "p-1");
    assert(plan.router_address == kRouter);
    assert(plan.calldata == "0x83bd37f90001");
    assert(plan.value == 0);
    assert(plan.expected_output == *common::parseUnits("0.3195", 18));
    assert(plan.expires_at_ms == 1700000000000LL + 30000);

    const auto& quote_body = rest->bodies.at("/sor/quote/v2");
    assert(quote_body["chainId"] == 42161);
    assert(quote_body["inputTokens"][0]["tokenAddress"] == kUsdc.token_address);
    assert(quote_body["inputTokens"][0]["amount"] == "1000000000");
    assert(quote_body["outputTokens"][0]["tokenAddress"] == evm::kZeroAddress);
    assert(rest->bodies.at("/sor/assemble")["pathId"] == "p-1");

    rest->reply("/sor/quote/v2", 400, R"({"detail":"unsupported token"})");
    bool permanent = false;
    try {
        odos.quote(kUsdc, kEth, 1, kWallet);
    } catch (const ExternalCallError& e) {
        permanent = e.errorClass() == ErrorClass::PERMANENT;
    }
    assert(permanent);
    std::cout << "[TEST] OdosQuoteSource ok\n";
}

void testSignEip1559() {
    auto rpc = std::make_shared<ScriptedRpc>();
    EvmRpcChainClient chain(chainConfig(), rpc);

    rpc->result("eth_getTransactionCount", "0x7");
    rpc->result("eth_estimateGas", "0x5208");
    rpc->result("eth_gasPrice", "0x64");
    nlohmann::json history;
    history["reward"] = nlohmann::json::array({
        nlohmann::json::array({"0x0"}), nlohmann::json::array({"0xa"}), nlohmann::json::array({"0x14"})});
    rpc->result("eth_feeHistory", history);
    rpc->result("eth_signTransaction", {{"raw", "0x02f86b"}, {"tx", {{"hash", "0xABCDEF"}}}});

    const auto intent = chain.transferIntent(kUsdc, "0x2222222222222222222222222222222222222222", 1000000);
    const auto signed_tx = chain.sign(intent);
    assert(signed_tx.raw == "0x02f86b");
    assert(signed_tx.hash == "0xabcdef");

    const auto& sign_call = rpc->last("eth_signTransaction");
    assert(sign_call.url == "http://signer.test");
    const auto& tx = sign_call.params[0];
    assert(tx["to"] == kUsdc.token_address);
    assert(tx["data"] == intent.data);
    assert(tx["nonce"] == "0x7");
    assert(tx["gas"] == common::toHexQuantity(Amount(25200)));
    assert(tx["chainId"] == common::toHexQuantity(Amount(42161)));
    assert(tx["type"] == "0x2");
    // priority: mean of the non-zero rewards (10, 20); max fee: gas price + priority * 1.05
    assert(tx["maxPriorityFeePerGas"] == common::toHexQuantity(Amount(15)));
    assert(tx["maxFeePerGas"] == common::toHexQuantity(Amount(115)));
    assert(rpc->last("eth_getTransactionCount").params[1] == "pending");
    std::cout << "[TEST] EvmRpcChainClient sign ok\n";
}

void testSubmit() {
    auto rpc = std::make_shared<ScriptedRpc>();
    EvmRpcChainClient chain(chainConfig(), rpc);

    core::SignedTransaction tx;
    tx.raw = "0x02f86b";
    tx.hash = "0xabc";

    rpc->result("eth_sendRawTransaction", "0xabc");
    assert(chain.submit(tx) == "0xabc");

    // the same bytes again
    rpc->error("eth_sendRawTransaction", -32000, "already known");
    assert(chain.submit(tx) == "0xabc");
    assert(rpc->last("eth_sendRawTransaction").params[0] == "0x02f86b");

    rpc->error("eth_sendRawTransaction", -32000, "insufficient funds for gas * price + value");
    bool permanent = false;
    try {
        chain.submit(tx);
    } catch (const ExternalCallError& e) {
        permanent = e.errorClass() == ErrorClass::PERMANENT;
    }
    assert(permanent);
    std::cout << "[TEST] EvmRpcChainClient submit ok\n";
}

void testConfirmations() {
    auto rpc = std::make_shared<ScriptedRpc>();
    EvmRpcChainClient chain(chainConfig(), rpc);
    const core::TransferWatch watch{kUsdc, kWallet};

    rpc->result("eth_getTransactionReceipt", nullptr);
    rpc->result("eth_getTransactionByHash", nullptr);
    assert(chain.confirmationsOf("0xaa", watch).status == core::ChainTxStatus::NOT_FOUND);

    rpc->result("eth_getTransactionReceipt", nullptr);
    rpc->result("eth_getTransactionByHash", {{"hash", "0xaa"}});
    assert(chain.confirmationsOf("0xaa", watch).status == core::ChainTxStatus::PENDING);

    const Amount first = *common::parseUnits("600", 6);
    const Amount second = *common::parseUnits("399.5", 6);
    nlohmann::json receipt = {
        {"transactionHash", "0xaa"},
        {"blockNumber", "0x10"},
        {"status", "0x1"},
        {"logs", nlohmann::json::array({
            transferLog(kUsdc.token_address, kWallet, first),
            transferLog(kUsdc.token_address, kWallet, second),
            // other recipient and other token are not counted
            transferLog(kUsdc.token_address, kRouter, 5),
            transferLog("0xfd086bc7cd5c481dcc9c85ebe478a1c0b69fcbb9", kWallet, 7),
        })},
    };
    rpc->result("eth_getTransactionReceipt", receipt);
    rpc->result("eth_blockNumber", "0x12");
    const auto confirmed = chain.confirmationsOf("0xaa", watch);
    assert(confirmed.status == core::ChainTxStatus::SUCCEEDED);
    assert(confirmed.depth == 3);
    assert(confirmed.observed_amount == *common::parseUnits("999.5", 6));

    receipt["status"] = "0x0";
    rpc->result("eth_getTransactionReceipt", receipt);
    rpc->result("eth_blockNumber", "0x10");
    const auto reverted = chain.confirmationsOf("0xaa", watch);
    assert(reverted.status == core::ChainTxStatus::REVERTED);
    assert(reverted.depth == 1);
    std::cout << "[TEST] EvmRpcChainClient confirmations ok\n";
}

void testReads() {
    auto rpc = std::make_shared<ScriptedRpc>();
    EvmRpcChainClient chain(chainConfig(), rpc);

    rpc->result("eth_call", "0x" + common::toAbiWord(Amount(1000000)));
    assert(chain.allowance(kWallet, kUsdc, kRouter) == Amount(1000000));
    const auto& call = rpc->last("eth_call");
    assert(call.params[0]["data"] == evm::encodeAllowance(kWallet, kRouter));

    assert(chain.allowance(kWallet, kEth, kRouter) == std::numeric_limits<Amount>::max());

    rpc->result("eth_getBalance", "0xde0b6b3a7640000");
    assert(chain.balanceOf(kWallet, kEth) == *common::parseUnits("1", 18));

    bool invalid = false;
    try {
        chain.approvalIntent(kEth, kRouter, 1);
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert(invalid);
    std::cout << "[TEST] EvmRpcChainClient reads ok\n";
}

} // namespace

int main() {
    testOdosQuote();
    testSignEip1559();
    testSubmit();
    testConfirmations();
    testReads();

    std::cout << "[TEST] ChainClients PASSED\n";
    return 0;
}
