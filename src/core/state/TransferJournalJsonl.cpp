#include "core/state/TransferJournalJsonl.h"

#include <algorithm>
#include <fstream>

namespace chainshuttle {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

TransferJournalJsonl::TransferJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception&) {
            // A torn final line after a crash; keep scanning.
        }
    }
}

bool TransferJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["transfer_key"] = event.transfer_key;
    line["state"] = event.state;
    line["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out.good()) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> TransferJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = fromString(line.value("type", std::string("STATE_CHANGED")));
        event.transfer_key = line.value("transfer_key", std::string());
        event.state = line.value("state", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t TransferJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string TransferJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::TRANSFER_ADMITTED: return "TRANSFER_ADMITTED";
        case JournalEventType::STATE_CHANGED: return "STATE_CHANGED";
        case JournalEventType::EXTERNAL_SUBMITTED: return "EXTERNAL_SUBMITTED";
        case JournalEventType::RETRY_SCHEDULED: return "RETRY_SCHEDULED";
        case JournalEventType::TRANSFER_CANCELLED: return "TRANSFER_CANCELLED";
        case JournalEventType::TRANSFER_SETTLED: return "TRANSFER_SETTLED";
    }
    return "STATE_CHANGED";
}

JournalEventType TransferJournalJsonl::fromString(const std::string& value) {
    if (value == "TRANSFER_ADMITTED") return JournalEventType::TRANSFER_ADMITTED;
    if (value == "STATE_CHANGED") return JournalEventType::STATE_CHANGED;
    if (value == "EXTERNAL_SUBMITTED") return JournalEventType::EXTERNAL_SUBMITTED;
    if (value == "RETRY_SCHEDULED") return JournalEventType::RETRY_SCHEDULED;
    if (value == "TRANSFER_CANCELLED") return JournalEventType::TRANSFER_CANCELLED;
    if (value == "TRANSFER_SETTLED") return JournalEventType::TRANSFER_SETTLED;
    return JournalEventType::STATE_CHANGED;
}

} // namespace core
} // namespace chainshuttle
