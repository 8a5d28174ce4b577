#include "polystore/record_store.hpp"

#include "polystore/error.hpp"

namespace polystore {

InMemoryRecordStore::InMemoryRecordStore(std::string name) : name_(std::move(name)) {}

std::string InMemoryRecordStore::insert(const StoreRecord& record) {
    if (record.document_id.empty()) {
        throw StoreError("Record has no document id", name_);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = name_ + "-" + std::to_string(next_id_++);
    records_[id] = record;
    return id;
}

bool InMemoryRecordStore::remove(const std::string& record_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(record_id);
    return true;
}

bool InMemoryRecordStore::exists(const std::string& record_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(record_id) > 0;
}

size_t InMemoryRecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::optional<StoreRecord> InMemoryRecordStore::get(const std::string& record_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(record_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

} // namespace polystore
