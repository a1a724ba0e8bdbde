/**
 * @file memory.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 */

#pragma once

#include <atomic>
#include <string>
#include <unordered_map>
#include <vector>
#include <ll/nt/table.hpp>

namespace ll {
namespace nt {

/**
 * @brief Table held entirely in process memory. Thread safe.
 *
 */
class MemoryTable : public Table {
 public:
    explicit MemoryTable(const std::string &name);
    ~MemoryTable() override;

    std::string name() const override;
    Value get(const std::string &key) const override;
    bool exists(const std::string &key) const override;
    std::vector<std::string> keys() const override;
    void flush() override;

    /** Number of flush() calls so far. */
    inline size_t flushCount() const { return flushes_; }

 protected:
    bool put(const std::string &key, const Value &value) override;

 private:
    std::string name_;
    mutable DECLARE_SHARED_MUTEX(mtx_);
    std::unordered_map<std::string, Value> values_;
    std::atomic<size_t> flushes_{0};
};

/**
 * @brief An instance of MemoryTable objects, one per name.
 *
 */
class MemoryInstance : public Instance {
 public:
    MemoryInstance() {}
    ~MemoryInstance() override {}

    TablePtr getTable(const std::string &name) override;
    void flush() override;

 private:
    DECLARE_MUTEX(mtx_);
    std::unordered_map<std::string, std::shared_ptr<MemoryTable>> tables_;
};

}  // namespace nt
}  // namespace ll
