#include "core/state/TransferRecordStoreJson.h"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "common/Logger.h"
#include "core/execution/TransferStateMachine.h"
#include "core/model/TransferSchema.h"

namespace chainshuttle {
namespace core {

TransferRecordStoreJson::TransferRecordStoreJson(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    std::filesystem::create_directories(directory_);
}

std::filesystem::path TransferRecordStoreJson::pathFor(const std::string& key) const {
    return directory_ / (key + ".json");
}

std::optional<TransferRecord> TransferRecordStoreJson::load(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open transfer record: " + path.string());
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return recordFromJson(raw);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("malformed transfer record " + path.string() + ": " + e.what());
    }
}

void TransferRecordStoreJson::save(const TransferRecord& record) const {
    const auto file_path = pathFor(record.key);
    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot write transfer record: " + tmp_path.string());
        }
        out << toJson(record).dump(2);
        out.flush();
        if (!out.good()) {
            throw std::runtime_error("short write on transfer record: " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("cannot replace transfer record: " + file_path.string());
    }
}

TransferRecord TransferRecordStoreJson::create(const TransferRequest& request, long long now_ms) {
    const std::string key = deriveIdempotencyKey(request);
    if (!isValidIdempotencyKey(key)) {
        throw std::invalid_argument("invalid idempotency key: " + key);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = load(pathFor(key));
    if (existing) {
        if (!requestsEquivalent(existing->request, request)) {
            throw ConflictError("idempotency key reused with different request: " + key);
        }
        return *existing;
    }

    TransferRecord record = makeInitialRecord(request, key, now_ms);
    save(record);
    return record;
}

std::optional<TransferRecord> TransferRecordStoreJson::get(const std::string& key) const {
    if (!isValidIdempotencyKey(key)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return load(pathFor(key));
}

CasResult TransferRecordStoreJson::compareAndSwap(
    const std::string& key,
    std::uint64_t expected_version,
    const TransferRecord& new_record
) {
    if (!isValidIdempotencyKey(key)) {
        return CasResult::NOT_FOUND;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto current = load(pathFor(key));
    if (!current) {
        return CasResult::NOT_FOUND;
    }
    if (current->version != expected_version) {
        return CasResult::VERSION_CONFLICT;
    }

    const auto violation = execution::TransferStateMachine::validateUpdate(*current, new_record);
    if (violation) {
        LOG_WARN("[Store] rejected update of {}: {}", key, *violation);
        return CasResult::REJECTED;
    }

    TransferRecord stored = new_record;
    stored.version = expected_version + 1;
    save(stored);
    return CasResult::OK;
}

std::vector<TransferRecord> TransferRecordStoreJson::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferRecord> out;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        try {
            auto record = load(entry.path());
            if (record) {
                out.push_back(std::move(*record));
            }
        } catch (const std::exception& e) {
            LOG_WARN("[Store] skipping {}: {}", entry.path().string(), e.what());
        }
    }
    if (ec) {
        LOG_WARN("[Store] cannot list {}: {}", directory_.string(), ec.message());
    }
    return out;
}

} // namespace core
} // namespace chainshuttle
