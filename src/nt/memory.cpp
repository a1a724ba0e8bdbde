/**
 * @file memory.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#include <ll/nt/memory.hpp>

#include <loguru.hpp>

using ll::nt::MemoryTable;
using ll::nt::MemoryInstance;
using ll::nt::Value;
using ll::nt::TablePtr;
using std::string;

static ll::nt::InstancePtr default_instance;
static std::mutex globalmtx;

MemoryTable::MemoryTable(const string &name) : name_(name) {}

MemoryTable::~MemoryTable() {}

string MemoryTable::name() const {
    return name_;
}

bool MemoryTable::put(const string &key, const Value &value) {
    UNIQUE_LOCK(mtx_, lk);
    values_[key] = value;
    return true;
}

Value MemoryTable::get(const string &key) const {
    SHARED_LOCK(mtx_, lk);
    auto it = values_.find(key);
    if (it == values_.end()) return {};
    return it->second;
}

bool MemoryTable::exists(const string &key) const {
    SHARED_LOCK(mtx_, lk);
    return values_.count(key) > 0;
}

std::vector<string> MemoryTable::keys() const {
    SHARED_LOCK(mtx_, lk);
    std::vector<string> result;
    result.reserve(values_.size());
    for (const auto &v : values_) {
        result.push_back(v.first);
    }
    return result;
}

void MemoryTable::flush() {
    ++flushes_;
}

TablePtr MemoryInstance::getTable(const string &name) {
    UNIQUE_LOCK(mtx_, lk);
    auto it = tables_.find(name);
    if (it != tables_.end()) return it->second;

    auto table = std::make_shared<MemoryTable>(name);
    tables_[name] = table;
    VLOG(1) << "Created memory table: " << name;
    return table;
}

void MemoryInstance::flush() {
    UNIQUE_LOCK(mtx_, lk);
    for (auto &t : tables_) {
        t.second->flush();
    }
}

ll::nt::InstancePtr ll::nt::getDefaultInstance() {
    UNIQUE_LOCK(globalmtx, lk);
    if (!default_instance) {
        default_instance = std::make_shared<MemoryInstance>();
    }
    return default_instance;
}

void ll::nt::setDefaultInstance(const ll::nt::InstancePtr &instance) {
    UNIQUE_LOCK(globalmtx, lk);
    default_instance = instance;
}
